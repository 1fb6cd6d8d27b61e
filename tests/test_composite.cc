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

// tests for the output compositor, reached via the dispatch pointer

#include <gtest/gtest.h>

#include "viewsynth_dispatch.h"

using namespace viewsynth ;

namespace
{

const long w = 8 , h = 6 ;

struct composite_test
: public ::testing::Test
{
  image_t synth ;
  image_t sketch ;
  image_t central ;
  image_t source ;
  image_t frame ;

  composite_test()
  : synth ( shape_type { 8 , 6 } ) ,
    sketch ( shape_type { 8 , 6 } ) ,
    central ( shape_type { 8 , 6 } ) ,
    source ( shape_type { 8 , 6 } ) ,
    frame ( shape_type { 32 , 6 } )
  {
    synth.set_data ( px_t { 0.2f , 0.4f , 0.6f } ) ;
    central.set_data ( px_t { 0.1f , 0.1f , 0.1f } ) ;
    source.set_data ( px_t { 0.9f , 0.8f , 0.7f } ) ;

    // the object covers x in [2,5), y in [1,4)

    sketch.set_data ( px_t { 0.0f , 0.0f , 0.0f } ) ;
    for ( long y = 1 ; y < 4 ; y++ )
    {
      for ( long x = 2 ; x < 5 ; x++ )
        sketch [ { x , y } ] = px_t { 0.5f , 0.5f , 1.0f } ;
    }
  }

  bool inside ( long x , long y ) const
  {
    return x >= 2 && x < 5 && y >= 1 && y < 4 ;
  }
} ;

void expect_pixel ( const px_t & px , const px_t & expected )
{
  EXPECT_FLOAT_EQ ( px[0] , expected[0] ) ;
  EXPECT_FLOAT_EQ ( px[1] , expected[1] ) ;
  EXPECT_FLOAT_EQ ( px[2] , expected[2] ) ;
}

} ; // anonymous namespace

TEST_F ( composite_test , frame_tiles_and_silhouette )
{
  ASSERT_TRUE ( get_dispatch()->composite ( synth , sketch , central ,
                                            source , frame ) ) ;

  px_t white { 1.0f , 1.0f , 1.0f } ;

  for ( long y = 0 ; y < h ; y++ )
  {
    for ( long x = 0 ; x < w ; x++ )
    {
      // sketch, central, masked synthesis, source - left to right

      expect_pixel ( frame [ { x , y } ] , sketch [ { x , y } ] ) ;
      expect_pixel ( frame [ { w + x , y } ] , px_t { 0.1f , 0.1f , 0.1f } ) ;

      if ( inside ( x , y ) )
        expect_pixel ( frame [ { 2 * w + x , y } ] ,
                       px_t { 0.2f , 0.4f , 0.6f } ) ;
      else
        expect_pixel ( frame [ { 2 * w + x , y } ] , white ) ;

      expect_pixel ( frame [ { 3 * w + x , y } ] ,
                     px_t { 0.9f , 0.8f , 0.7f } ) ;
    }
  }
}

TEST_F ( composite_test , dark_object_pixels_are_not_background )
{
  // only exactly black counts as background

  sketch [ { 0L , 0L } ] = px_t { 0.0f , 0.0f , 1e-3f } ;

  ASSERT_TRUE ( get_dispatch()->composite ( synth , sketch , central ,
                                            source , frame ) ) ;

  expect_pixel ( frame [ { 2 * w , 0L } ] , px_t { 0.2f , 0.4f , 0.6f } ) ;
  expect_pixel ( frame [ { 2 * w + 1 , 0L } ] , px_t { 1.0f , 1.0f , 1.0f } ) ;
}

TEST_F ( composite_test , wrong_frame_shape_is_rejected )
{
  image_t narrow ( shape_type { 24 , 6 } ) ;
  EXPECT_FALSE ( get_dispatch()->composite ( synth , sketch , central ,
                                             source , narrow ) ) ;

  image_t other ( shape_type { 4 , 6 } ) ;
  EXPECT_FALSE ( get_dispatch()->composite ( other , sketch , central ,
                                             source , frame ) ) ;
}
