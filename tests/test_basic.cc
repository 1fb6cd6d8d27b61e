/************************************************************************/
/*                                                                      */
/*    viewsynth - interactive novel view synthesis from keypoints       */
/*                                                                      */
/*            Copyright 2024 by Kay F. Jahnke                           */
/*                                                                      */
/*    Permission is hereby granted, free of charge, to any person       */
/*    obtaining a copy of this software and associated documentation    */
/*    files (the "Software"), to deal in the Software without           */
/*    restriction, including without limitation the rights to use,      */
/*    copy, modify, merge, publish, distribute, sublicense, and/or      */
/*    sell copies of the Software, and to permit persons to whom the    */
/*    Software is furnished to do so, subject to the following          */
/*    conditions:                                                       */
/*                                                                      */
/*    The above copyright notice and this permission notice shall be    */
/*    included in all copies or substantial portions of the             */
/*    Software.                                                         */
/*                                                                      */
/*    THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND    */
/*    EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES   */
/*    OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND          */
/*    NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT       */
/*    HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,      */
/*    WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING      */
/*    FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR     */
/*    OTHER DEALINGS IN THE SOFTWARE.                                   */
/*                                                                      */
/************************************************************************/

// tests for the basic enums, tables and helpers

#include <gtest/gtest.h>

#include "viewsynth_basic.h"

using namespace viewsynth ;

TEST ( basic , object_classes_parse )
{
  EXPECT_EQ ( parse_object_class ( "car" ) , CLS_CAR ) ;
  EXPECT_EQ ( parse_object_class ( "chair" ) , CLS_CHAIR ) ;
  EXPECT_EQ ( parse_object_class ( "sofa" ) , CLS_NONE ) ;
  EXPECT_EQ ( parse_object_class ( "" ) , CLS_NONE ) ;
}

TEST ( basic , plane_sets_and_channel_counts )
{
  EXPECT_EQ ( plane_count ( CLS_CAR ) , 5u ) ;
  EXPECT_EQ ( plane_count ( CLS_CHAIR ) , 4u ) ;
  EXPECT_EQ ( plane_count ( CLS_NONE ) , 0u ) ;

  EXPECT_EQ ( input_channels ( CLS_CAR ) , 21u ) ;
  EXPECT_EQ ( input_channels ( CLS_CHAIR ) , 18u ) ;

  for ( auto cls : { CLS_CAR , CLS_CHAIR } )
  {
    for ( const auto & def : plane_defs ( cls ) )
    {
      EXPECT_GE ( def.kpoints.size() , 3u ) << def.name ;
      EXPECT_LE ( def.kpoints.size() , 4u ) << def.name ;
    }
  }
}

TEST ( basic , key_bindings )
{
  EXPECT_EQ ( key_to_event ( 'F' ) , EV_ROTATE_UP ) ;
  EXPECT_EQ ( key_to_event ( 'f' ) , EV_ROTATE_UP ) ;
  EXPECT_EQ ( key_to_event ( 'D' ) , EV_ROTATE_DOWN ) ;
  EXPECT_EQ ( key_to_event ( 'A' ) , EV_ROTATE_LEFT ) ;
  EXPECT_EQ ( key_to_event ( 's' ) , EV_ROTATE_RIGHT ) ;
  EXPECT_EQ ( key_to_event ( 'G' ) , EV_ZOOM_IN ) ;
  EXPECT_EQ ( key_to_event ( 'H' ) , EV_ZOOM_OUT ) ;
  EXPECT_EQ ( key_to_event ( ' ' ) , EV_NEXT_EXAMPLE ) ;
  EXPECT_EQ ( key_to_event ( 'n' ) , EV_NEXT_MODEL ) ;
  EXPECT_EQ ( key_to_event ( 'X' ) , EV_DUMP_FRAME ) ;
  EXPECT_EQ ( key_to_event ( 'R' ) , EV_NO_OP ) ;
  EXPECT_EQ ( key_to_event ( '0' ) , EV_NO_OP ) ;
  EXPECT_EQ ( key_to_event ( 'q' ) , EV_NONE ) ;
  EXPECT_EQ ( key_to_event ( '7' ) , EV_NONE ) ;
}

TEST ( basic , dump_names_are_zero_padded )
{
  EXPECT_EQ ( dump_name ( 0 , 0 , 90 , 7 ) , "000_el_000_az_090_rad_007" ) ;
  EXPECT_EQ ( dump_name ( 12 , 45 , 355 , 20 ) ,
              "012_el_045_az_355_rad_020" ) ;
}

TEST ( basic , name_tables_end_with_unsupported )
{
  EXPECT_STREQ ( object_class_name [ CLS_NONE ] , "unsupported" ) ;
  EXPECT_STREQ ( event_name [ EV_NONE ] , "unsupported" ) ;
  EXPECT_STREQ ( colour_space_name [ CS_NONE ] , "unsupported" ) ;
  EXPECT_STREQ ( event_name [ EV_NO_OP ] , "no_op" ) ;
}
