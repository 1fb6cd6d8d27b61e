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

// SIMD code for the conversion of image data to and from the synthesis
// model's colour space: sRGB in [0,1] on the one side, and the model's
// normalized range [-1,1] - optionally after conversion to CIE Lab -
// on the other. The per-pixel functions in assemble.h do the same for
// single pixels. The colour math is written for simdized values; lanes
// which take the 'other' branch of a piecewise function are fixed up
// with masked assignments.

#include "zimt/zimt.h"
#include "common.h"

#if defined(VIEWSYNTH_COLOUR_H) == defined(HWY_TARGET_TOGGLE)
  #ifdef VIEWSYNTH_COLOUR_H
    #undef VIEWSYNTH_COLOUR_H
  #else
    #define VIEWSYNTH_COLOUR_H
  #endif

HWY_BEFORE_NAMESPACE() ;
BEGIN_ZIMT_SIMD_NAMESPACE(viewsynth)

// D65 reference white

const float lab_white [ 3 ] { 0.95047f , 1.0f , 1.08883f } ;

template < class VT >
VT srgb_to_linear ( const VT & c )
{
  VT result = pow ( ( c + 0.055f ) / 1.055f , 2.4f ) ;
  result ( c <= 0.04045f ) = c / 12.92f ;
  return result ;
}

template < class VT >
VT linear_to_srgb ( VT c )
{
  c ( c < 0.0f ) = 0.0f ;
  VT result = 1.055f * pow ( c , 1.0f / 2.4f ) - 0.055f ;
  result ( c <= 0.0031308f ) = c * 12.92f ;
  result ( result > 1.0f ) = 1.0f ;
  result ( result < 0.0f ) = 0.0f ;
  return result ;
}

template < class VT >
VT lab_f ( const VT & t )
{
  const float delta = 6.0f / 29.0f ;
  VT result = pow ( t , 1.0f / 3.0f ) ;
  result ( t <= delta * delta * delta )
    = t / ( 3.0f * delta * delta ) + 4.0f / 29.0f ;
  return result ;
}

template < class VT >
VT lab_f_inv ( const VT & t )
{
  const float delta = 6.0f / 29.0f ;
  VT result = t * t * t ;
  result ( t <= delta ) = 3.0f * delta * delta * ( t - 4.0f / 29.0f ) ;
  return result ;
}

// encode_t maps sRGB pixels to the model's input range

template < std::size_t L >
struct encode_t
: public zimt::unary_functor < px_t , px_t , L >
{
  typedef zimt::simdized_type < float , L > f_v ;
  typedef zimt::simdized_type < px_t , L > px_v ;

  colour_space_t mode ;

  encode_t ( colour_space_t _mode )
  : mode ( _mode )
  { }

  void eval ( const px_v & in , px_v & out )
  {
    out = in ;

    if ( mode == CS_LAB )
    {
      f_v r = srgb_to_linear ( in[0] ) ;
      f_v g = srgb_to_linear ( in[1] ) ;
      f_v b = srgb_to_linear ( in[2] ) ;

      f_v fx = lab_f ( (   0.4124564f * r + 0.3575761f * g
                         + 0.1804375f * b ) / lab_white[0] ) ;
      f_v fy = lab_f ( (   0.2126729f * r + 0.7151522f * g
                         + 0.0721750f * b ) / lab_white[1] ) ;
      f_v fz = lab_f ( (   0.0193339f * r + 0.1191920f * g
                         + 0.9503041f * b ) / lab_white[2] ) ;

      // L, a and b, scaled to [0,1]

      out[0] = ( 116.0f * fy - 16.0f ) / 100.0f ;
      out[1] = ( 500.0f * ( fx - fy ) + 128.0f ) / 255.0f ;
      out[2] = ( 200.0f * ( fy - fz ) + 128.0f ) / 255.0f ;
    }

    out = out * 2.0f - 1.0f ;
  }
} ;

// decode_t is the inverse, producing displayable sRGB in [0,1]

template < std::size_t L >
struct decode_t
: public zimt::unary_functor < px_t , px_t , L >
{
  typedef zimt::simdized_type < float , L > f_v ;
  typedef zimt::simdized_type < px_t , L > px_v ;

  colour_space_t mode ;

  decode_t ( colour_space_t _mode )
  : mode ( _mode )
  { }

  void eval ( const px_v & in , px_v & out )
  {
    out = ( in + 1.0f ) / 2.0f ;

    if ( mode == CS_LAB )
    {
      f_v fy = ( out[0] * 100.0f + 16.0f ) / 116.0f ;
      f_v fx = fy + ( out[1] * 255.0f - 128.0f ) / 500.0f ;
      f_v fz = fy - ( out[2] * 255.0f - 128.0f ) / 200.0f ;

      f_v x = lab_white[0] * lab_f_inv ( fx ) ;
      f_v y = lab_white[1] * lab_f_inv ( fy ) ;
      f_v z = lab_white[2] * lab_f_inv ( fz ) ;

      out[0] = linear_to_srgb
        ( 3.2404542f * x - 1.5371385f * y - 0.4985314f * z ) ;
      out[1] = linear_to_srgb
        ( - 0.9692660f * x + 1.8760108f * y + 0.0415560f * z ) ;
      out[2] = linear_to_srgb
        ( 0.0556434f * x - 0.2040259f * y + 1.0572252f * z ) ;
    }
    else
    {
      for ( int c = 0 ; c < 3 ; c++ )
      {
        out[c] ( out[c] < 0.0f ) = 0.0f ;
        out[c] ( out[c] > 1.0f ) = 1.0f ;
      }
    }
  }
} ;

// encode 'src' into 'trg', which may be a strided view into a tensor

template < std::size_t L = LANES >
void encode_image ( image_view_t & src ,
                    image_view_t & trg ,
                    colour_space_t mode )
{
  zimt::loader < float , 3 , 2 , L > ld ( src ) ;
  encode_t < L > act ( mode ) ;
  zimt::storer < float , 3 , 2 , L > st ( trg ) ;
  zimt::process ( src.shape , ld , act , st ) ;
}

// decode a model output in place

template < std::size_t L = LANES >
void decode_image ( image_view_t & image , colour_space_t mode )
{
  zimt::loader < float , 3 , 2 , L > ld ( image ) ;
  decode_t < L > act ( mode ) ;
  zimt::storer < float , 3 , 2 , L > st ( image ) ;
  zimt::process ( image.shape , ld , act , st ) ;
}

END_ZIMT_SIMD_NAMESPACE
HWY_AFTER_NAMESPACE() ;

#endif // sentinel
