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

// tests for the synthesis input assembler and the baseline model

#include <gtest/gtest.h>

#include "assemble.h"
#include "synthesis.h"

using namespace viewsynth ;

namespace
{

typedef zimt::xel_t < std::size_t , 3 > shape3_t ;

void fill ( image_view_t image , const px_t & value )
{
  image.set_data ( value ) ;
}

} ; // anonymous namespace

TEST ( assemble , rgb_encoding_is_linear )
{
  px_t code = encode_pixel ( px_t { 0.0f , 0.5f , 1.0f } , CS_RGB ) ;
  EXPECT_FLOAT_EQ ( code[0] , -1.0f ) ;
  EXPECT_FLOAT_EQ ( code[1] , 0.0f ) ;
  EXPECT_FLOAT_EQ ( code[2] , 1.0f ) ;

  px_t back = decode_pixel ( code , CS_RGB ) ;
  EXPECT_FLOAT_EQ ( back[1] , 0.5f ) ;

  // decoding clamps to the displayable range

  back = decode_pixel ( px_t { 2.0f , -3.0f , 0.0f } , CS_RGB ) ;
  EXPECT_FLOAT_EQ ( back[0] , 1.0f ) ;
  EXPECT_FLOAT_EQ ( back[1] , 0.0f ) ;
}

TEST ( assemble , lab_reference_values )
{
  px_t white = rgb_to_lab ( px_t { 1.0f , 1.0f , 1.0f } ) ;
  EXPECT_NEAR ( white[0] , 100.0f , 1e-2f ) ;
  EXPECT_NEAR ( white[1] , 0.0f , 1e-2f ) ;
  EXPECT_NEAR ( white[2] , 0.0f , 1e-2f ) ;

  px_t black = rgb_to_lab ( px_t { 0.0f , 0.0f , 0.0f } ) ;
  EXPECT_NEAR ( black[0] , 0.0f , 1e-3f ) ;

  // sRGB red is at about L 53.2, a 80.1, b 67.2

  px_t red = rgb_to_lab ( px_t { 1.0f , 0.0f , 0.0f } ) ;
  EXPECT_NEAR ( red[0] , 53.24f , 0.1f ) ;
  EXPECT_NEAR ( red[1] , 80.09f , 0.2f ) ;
  EXPECT_NEAR ( red[2] , 67.20f , 0.2f ) ;

  px_t code = encode_pixel ( px_t { 1.0f , 1.0f , 1.0f } , CS_LAB ) ;
  EXPECT_NEAR ( code[0] , 1.0f , 1e-3f ) ;
  EXPECT_NEAR ( code[1] , 2.0f * 128.0f / 255.0f - 1.0f , 1e-3f ) ;

  px_t orange { 0.9f , 0.5f , 0.1f } ;
  px_t back = decode_pixel ( encode_pixel ( orange , CS_LAB ) , CS_LAB ) ;
  EXPECT_NEAR ( back[0] , orange[0] , 1e-3f ) ;
  EXPECT_NEAR ( back[1] , orange[1] , 1e-3f ) ;
  EXPECT_NEAR ( back[2] , orange[2] , 1e-3f ) ;
}

// whole images are converted with SIMD code, which must agree with the
// per-pixel functions. The image size isn't a multiple of the lane
// count, so the partly filled last vector is covered as well.

TEST ( assemble , image_conversion_matches_single_pixels )
{
  const std::size_t w = 7 , h = 5 ;
  const std::size_t n = plane_count ( CLS_CHAIR ) ;

  image_t sketch ( shape_type { w , h } ) ;
  image_t central ( shape_type { w , h } ) ;
  plane_stack_t warped ( shape3_t { w , h , n } ) ;

  for ( long y = 0 ; y < long ( h ) ; y++ )
  {
    for ( long x = 0 ; x < long ( w ) ; x++ )
    {
      sketch [ { x , y } ] = px_t { x / 6.0f , y / 4.0f , 0.02f } ;
      central [ { x , y } ] = px_t { 0.9f , x / 6.0f , 1.0f - y / 4.0f } ;
    }
  }
  warped.set_data ( px_t { 0.3f , 0.6f , 0.001f } ) ;

  tensor_t tensor ( shape3_t { input_channels ( CLS_CHAIR ) , w , h } ) ;

  for ( colour_space_t mode : { CS_RGB , CS_LAB } )
  {
    ASSERT_TRUE ( assemble_input ( CLS_CHAIR , sketch , central , warped ,
                                   mode , tensor ) ) ;

    image_t decoded ( shape_type { w , h } ) ;

    for ( long y = 0 ; y < long ( h ) ; y++ )
    {
      for ( long x = 0 ; x < long ( w ) ; x++ )
      {
        px_t expected = encode_pixel ( central [ { x , y } ] , mode ) ;
        for ( long c = 0 ; c < 3 ; c++ )
        {
          EXPECT_NEAR ( ( tensor [ { 3L + c , x , y } ] ) , expected[c] ,
                        1e-3f ) << colour_space_name [ mode ] ;
          decoded [ { x , y } ] [ c ] = tensor [ { 3L + c , x , y } ] ;
        }
        expected = encode_pixel ( px_t { 0.3f , 0.6f , 0.001f } , mode ) ;
        EXPECT_NEAR ( ( tensor [ { 8L , x , y } ] ) , expected[2] , 1e-3f ) ;
      }
    }

    // and back to sRGB

    decode_output ( decoded , mode ) ;

    for ( long y = 0 ; y < long ( h ) ; y++ )
    {
      for ( long x = 0 ; x < long ( w ) ; x++ )
      {
        for ( int c = 0 ; c < 3 ; c++ )
          EXPECT_NEAR ( decoded [ { x , y } ] [ c ] ,
                        central [ { x , y } ] [ c ] , 2e-3f )
            << colour_space_name [ mode ] << " at " << x << ", " << y ;
      }
    }
  }
}

TEST ( assemble , channel_layout )
{
  const std::size_t w = 6 , h = 4 ;
  const std::size_t n = plane_count ( CLS_CHAIR ) ;

  image_t sketch ( shape_type { w , h } ) ;
  image_t central ( shape_type { w , h } ) ;
  plane_stack_t warped ( shape3_t { w , h , n } ) ;

  fill ( sketch , px_t { 1.0f , 1.0f , 1.0f } ) ;
  fill ( central , px_t { 0.5f , 0.5f , 0.5f } ) ;
  for ( std::size_t i = 0 ; i < n ; i++ )
    fill ( stack_slice ( warped , i ) ,
           px_t { 0.0f , 0.25f * i , 1.0f } ) ;

  tensor_t tensor ( shape3_t { input_channels ( CLS_CHAIR ) , w , h } ) ;
  ASSERT_EQ ( tensor.shape[0] , 18u ) ;

  ASSERT_TRUE ( assemble_input ( CLS_CHAIR , sketch , central , warped ,
                                 CS_RGB , tensor ) ) ;

  for ( long y = 0 ; y < long ( h ) ; y++ )
  {
    for ( long x = 0 ; x < long ( w ) ; x++ )
    {
      // sketch, then central

      EXPECT_FLOAT_EQ ( ( tensor [ { 0L , x , y } ] ) , 1.0f ) ;
      EXPECT_FLOAT_EQ ( ( tensor [ { 3L , x , y } ] ) , 0.0f ) ;

      // then the planes, in canonical order

      for ( long i = 0 ; i < long ( n ) ; i++ )
      {
        EXPECT_FLOAT_EQ ( ( tensor [ { 6L + 3 * i , x , y } ] ) , -1.0f ) ;
        EXPECT_FLOAT_EQ ( ( tensor [ { 7L + 3 * i , x , y } ] ) ,
                          0.5f * i - 1.0f ) ;
        EXPECT_FLOAT_EQ ( ( tensor [ { 8L + 3 * i , x , y } ] ) , 1.0f ) ;
      }
    }
  }
}

TEST ( assemble , mismatches_are_rejected )
{
  const std::size_t w = 4 , h = 4 ;

  image_t sketch ( shape_type { w , h } ) ;
  image_t central ( shape_type { w , h } ) ;
  plane_stack_t car_planes ( shape3_t { w , h , plane_count ( CLS_CAR ) } ) ;
  plane_stack_t chair_planes ( shape3_t { w , h , plane_count ( CLS_CHAIR ) } ) ;

  tensor_t car_tensor ( shape3_t { input_channels ( CLS_CAR ) , w , h } ) ;
  EXPECT_EQ ( car_tensor.shape[0] , 21u ) ;

  // a chair stack doesn't have the planes a car needs

  EXPECT_FALSE ( assemble_input ( CLS_CAR , sketch , central , chair_planes ,
                                  CS_LAB , car_tensor ) ) ;

  // tensor with the wrong channel count

  tensor_t chair_tensor ( shape3_t { input_channels ( CLS_CHAIR ) , w , h } ) ;
  EXPECT_FALSE ( assemble_input ( CLS_CAR , sketch , central , car_planes ,
                                  CS_LAB , chair_tensor ) ) ;

  // images of different size

  image_t big ( shape_type { 2 * w , h } ) ;
  EXPECT_FALSE ( assemble_input ( CLS_CAR , sketch , big , car_planes ,
                                  CS_LAB , car_tensor ) ) ;

  EXPECT_TRUE ( assemble_input ( CLS_CAR , sketch , central , car_planes ,
                                 CS_LAB , car_tensor ) ) ;
}

TEST ( synthesis , composite_model_blends_planes_over_the_sketch )
{
  const std::size_t w = 4 , h = 4 ;
  const std::size_t n = plane_count ( CLS_CHAIR ) ;

  image_t sketch ( shape_type { w , h } ) ;
  image_t central ( shape_type { w , h } ) ;
  plane_stack_t warped ( shape3_t { w , h , n } ) ;

  px_t black { 0.0f , 0.0f , 0.0f } ;
  fill ( sketch , px_t { 0.5f , 0.5f , 1.0f } ) ;
  fill ( central , black ) ;
  warped.set_data ( black ) ;

  // plane 1 has content in the left half, plane 2 everywhere

  auto p1 = stack_slice ( warped , 1 ) ;
  auto p2 = stack_slice ( warped , 2 ) ;
  for ( long y = 0 ; y < long ( h ) ; y++ )
  {
    for ( long x = 0 ; x < long ( w ) / 2 ; x++ )
      p1 [ { x , y } ] = px_t { 1.0f , 0.0f , 0.0f } ;
  }

  tensor_t tensor ( shape3_t { input_channels ( CLS_CHAIR ) , w , h } ) ;
  image_t output ( shape_type { w , h } ) ;
  composite_model_t model ( CLS_CHAIR , CS_RGB ) ;

  // where no plane has content, the output is the sketch

  ASSERT_TRUE ( assemble_input ( CLS_CHAIR , sketch , central , warped ,
                                 CS_RGB , tensor ) ) ;
  ASSERT_TRUE ( model.synthesize ( tensor , output ) ) ;
  decode_output ( output , CS_RGB ) ;
  EXPECT_NEAR ( ( output [ { 3L , 1L } ] [ 2 ] ) , 1.0f , 1e-5f ) ;
  EXPECT_NEAR ( ( output [ { 3L , 1L } ] [ 0 ] ) , 0.5f , 1e-5f ) ;

  fill ( p2 , px_t { 0.0f , 0.0f , 1.0f } ) ;

  ASSERT_TRUE ( assemble_input ( CLS_CHAIR , sketch , central , warped ,
                                 CS_RGB , tensor ) ) ;
  ASSERT_TRUE ( model.synthesize ( tensor , output ) ) ;
  decode_output ( output , CS_RGB ) ;

  // left: mean of planes 1 and 2, right: plane 2 only

  px_t left = output [ { 0L , 2L } ] ;
  px_t right = output [ { 3L , 2L } ] ;
  EXPECT_NEAR ( left[0] , 0.5f , 1e-5f ) ;
  EXPECT_NEAR ( left[2] , 0.5f , 1e-5f ) ;
  EXPECT_NEAR ( right[0] , 0.0f , 1e-5f ) ;
  EXPECT_NEAR ( right[2] , 1.0f , 1e-5f ) ;
}

TEST ( synthesis , composite_model_checks_its_input )
{
  composite_model_t model ( CLS_CAR , CS_LAB ) ;

  tensor_t chair_tensor ( shape3_t { input_channels ( CLS_CHAIR ) , 4 , 4 } ) ;
  image_t output ( shape_type { 4 , 4 } ) ;
  EXPECT_FALSE ( model.synthesize ( chair_tensor , output ) ) ;

  tensor_t car_tensor ( shape3_t { input_channels ( CLS_CAR ) , 4 , 4 } ) ;
  image_t small ( shape_type { 2 , 2 } ) ;
  EXPECT_FALSE ( model.synthesize ( car_tensor , small ) ) ;
}
