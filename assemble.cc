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

// implementation of the synthesis input assembler

#include "assemble.h"
#include "viewsynth_dispatch.h"

namespace viewsynth
{

namespace
{

// D65 reference white

const double white_x = 0.95047 ;
const double white_y = 1.0 ;
const double white_z = 1.08883 ;

double srgb_to_linear ( double c )
{
  if ( c <= 0.04045 )
    return c / 12.92 ;
  return std::pow ( ( c + 0.055 ) / 1.055 , 2.4 ) ;
}

double linear_to_srgb ( double c )
{
  if ( c <= 0.0031308 )
    return c * 12.92 ;
  return 1.055 * std::pow ( c , 1.0 / 2.4 ) - 0.055 ;
}

double lab_f ( double t )
{
  const double delta = 6.0 / 29.0 ;
  if ( t > delta * delta * delta )
    return std::cbrt ( t ) ;
  return t / ( 3.0 * delta * delta ) + 4.0 / 29.0 ;
}

double lab_f_inv ( double t )
{
  const double delta = 6.0 / 29.0 ;
  if ( t > delta )
    return t * t * t ;
  return 3.0 * delta * delta * ( t - 4.0 / 29.0 ) ;
}

float clamp01 ( double v )
{
  return float ( std::min ( 1.0 , std::max ( 0.0 , v ) ) ) ;
}

} ; // anonymous namespace

px_t rgb_to_lab ( const px_t & rgb )
{
  double r = srgb_to_linear ( rgb[0] ) ;
  double g = srgb_to_linear ( rgb[1] ) ;
  double b = srgb_to_linear ( rgb[2] ) ;

  double x = 0.4124564 * r + 0.3575761 * g + 0.1804375 * b ;
  double y = 0.2126729 * r + 0.7151522 * g + 0.0721750 * b ;
  double z = 0.0193339 * r + 0.1191920 * g + 0.9503041 * b ;

  double fx = lab_f ( x / white_x ) ;
  double fy = lab_f ( y / white_y ) ;
  double fz = lab_f ( z / white_z ) ;

  return px_t { float ( 116.0 * fy - 16.0 ) ,
                float ( 500.0 * ( fx - fy ) ) ,
                float ( 200.0 * ( fy - fz ) ) } ;
}

px_t lab_to_rgb ( const px_t & lab )
{
  double fy = ( lab[0] + 16.0 ) / 116.0 ;
  double fx = fy + lab[1] / 500.0 ;
  double fz = fy - lab[2] / 200.0 ;

  double x = white_x * lab_f_inv ( fx ) ;
  double y = white_y * lab_f_inv ( fy ) ;
  double z = white_z * lab_f_inv ( fz ) ;

  double r =   3.2404542 * x - 1.5371385 * y - 0.4985314 * z ;
  double g = - 0.9692660 * x + 1.8760108 * y + 0.0415560 * z ;
  double b =   0.0556434 * x - 0.2040259 * y + 1.0572252 * z ;

  return px_t { clamp01 ( linear_to_srgb ( std::max ( 0.0 , r ) ) ) ,
                clamp01 ( linear_to_srgb ( std::max ( 0.0 , g ) ) ) ,
                clamp01 ( linear_to_srgb ( std::max ( 0.0 , b ) ) ) } ;
}

// in Lab mode, L is scaled from [0,100] and a, b from [-128,127] to
// [0,1] before the common normalization with mean .5 and std .5

px_t encode_pixel ( const px_t & rgb , colour_space_t mode )
{
  px_t v = rgb ;
  if ( mode == CS_LAB )
  {
    px_t lab = rgb_to_lab ( rgb ) ;
    v = px_t { lab[0] / 100.0f ,
               ( lab[1] + 128.0f ) / 255.0f ,
               ( lab[2] + 128.0f ) / 255.0f } ;
  }
  return px_t { v[0] * 2.0f - 1.0f ,
                v[1] * 2.0f - 1.0f ,
                v[2] * 2.0f - 1.0f } ;
}

px_t decode_pixel ( const px_t & code , colour_space_t mode )
{
  px_t v { ( code[0] + 1.0f ) / 2.0f ,
           ( code[1] + 1.0f ) / 2.0f ,
           ( code[2] + 1.0f ) / 2.0f } ;

  if ( mode == CS_LAB )
  {
    px_t lab { v[0] * 100.0f ,
               v[1] * 255.0f - 128.0f ,
               v[2] * 255.0f - 128.0f } ;
    return lab_to_rgb ( lab ) ;
  }
  return px_t { clamp01 ( v[0] ) , clamp01 ( v[1] ) , clamp01 ( v[2] ) } ;
}

bool assemble_input ( object_class_t cls ,
                      image_t & sketch ,
                      image_t & central ,
                      plane_stack_t & warped ,
                      colour_space_t mode ,
                      tensor_t & tensor )
{
  std::size_t n = plane_count ( cls ) ;

  if ( warped.shape[2] != n )
  {
    std::cerr << "assemble_input: class " << object_class_name [ cls ]
              << " needs " << n << " planes, got " << warped.shape[2]
              << std::endl ;
    return false ;
  }

  std::size_t w = sketch.shape[0] ;
  std::size_t h = sketch.shape[1] ;

  if (    central.shape != sketch.shape
       || warped.shape[0] != w
       || warped.shape[1] != h )
  {
    std::cerr << "assemble_input: image sizes differ" << std::endl ;
    return false ;
  }

  std::size_t nch = input_channels ( cls ) ;
  zimt::xel_t < std::size_t , 3 > shape { nch , w , h } ;

  if ( tensor.shape != shape )
  {
    std::cerr << "assemble_input: tensor has wrong shape, expected "
              << nch << " channels of " << w << "x" << h << std::endl ;
    return false ;
  }

  // [sketch][central][plane 0] ... [plane n-1]

  auto p_dispatch = get_dispatch() ;

  p_dispatch->encode ( sketch , tensor_slot ( tensor , 0 ) , mode ) ;
  p_dispatch->encode ( central , tensor_slot ( tensor , 1 ) , mode ) ;

  for ( std::size_t i = 0 ; i < n ; i++ )
    p_dispatch->encode ( stack_slice ( warped , i ) ,
                         tensor_slot ( tensor , 2 + i ) , mode ) ;

  return true ;
}

void decode_output ( image_t & image , colour_space_t mode )
{
  get_dispatch()->decode ( image , mode ) ;
}

} ; // namespace viewsynth
