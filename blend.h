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

// SIMD code for the baseline synthesis model: per pixel, the mean of
// all warped planes which have content there, and the sketch where
// none has. The planes are accumulated one after the other into an
// array holding the running sum and the number of contributions.

#include <vector>

#include "zimt/zimt.h"
#include "common.h"

#if defined(VIEWSYNTH_BLEND_H) == defined(HWY_TARGET_TOGGLE)
  #ifdef VIEWSYNTH_BLEND_H
    #undef VIEWSYNTH_BLEND_H
  #else
    #define VIEWSYNTH_BLEND_H
  #endif

HWY_BEFORE_NAMESPACE() ;
BEGIN_ZIMT_SIMD_NAMESPACE(viewsynth)

// accumulator pixel: r, g, b sums and the contribution count

typedef zimt::xel_t < float , 4 > acc_t ;

// 'empty' is the value planes hold where they have no content. All
// views must have the same shape.

template < std::size_t L = LANES >
void blend_planes ( const std::vector < image_view_t > & planes ,
                    image_view_t & sketch ,
                    const px_t & empty ,
                    image_view_t & output )
{
  typedef zimt::simdized_type < float , L > f_v ;
  typedef zimt::simdized_type < px_t , L > px_v ;
  typedef zimt::simdized_type < acc_t , L > acc_v ;

  zimt::array_t < 2 , acc_t > acc ( sketch.shape ) ;
  acc_t zero ;
  zero = 0.0f ;
  acc.set_data ( zero ) ;

  // add one plane's content to the accumulator

  auto add = [empty] ( const acc_v & v1 , const px_v & v2 ,
                       acc_v & v3 , std::size_t cap = L )
  {
    auto blank =    ( v2[0] - empty[0] < 1e-3f )
                 && ( v2[0] - empty[0] > -1e-3f )
                 && ( v2[1] - empty[1] < 1e-3f )
                 && ( v2[1] - empty[1] > -1e-3f )
                 && ( v2[2] - empty[2] < 1e-3f )
                 && ( v2[2] - empty[2] > -1e-3f ) ;

    f_v weight ( 1.0f ) ;
    weight ( blank ) = 0.0f ;

    for ( int c = 0 ; c < 3 ; c++ )
      v3[c] = v1[c] + weight * v2[c] ;
    v3[3] = v1[3] + weight ;
  } ;

  zimt::pass_through < float , 4 , L > pass ;

  for ( auto plane : planes )
  {
    zimt::loader < float , 4 , 2 , L > ldacc ( acc ) ;
    zimt::loader < float , 3 , 2 , L > ldpx ( plane ) ;
    zimt::storer < float , 4 , 2 , L > st ( acc ) ;

    zimt::zip_t < float , 4 , 2 , L , decltype ( add ) ,
                  float , 3 , float , 4 > zip ( ldacc , ldpx , add ) ;

    zimt::process ( acc.shape , zip , pass , st ) ;
  }

  // form the mean, or fall back to the sketch

  auto finish = [] ( const acc_v & v1 , const px_v & v2 ,
                     px_v & v3 , std::size_t cap = L )
  {
    f_v count = v1[3] ;
    f_v none ( 0.0f ) ;
    none ( count < 0.5f ) = 1.0f ;
    count ( count < 0.5f ) = 1.0f ;

    for ( int c = 0 ; c < 3 ; c++ )
      v3[c] = ( v1[c] / count ) * ( 1.0f - none ) + v2[c] * none ;
  } ;

  zimt::loader < float , 4 , 2 , L > ldacc ( acc ) ;
  zimt::loader < float , 3 , 2 , L > ldsk ( sketch ) ;

  zimt::zip_t < float , 4 , 2 , L , decltype ( finish ) ,
                float , 3 , float , 3 > zip ( ldacc , ldsk , finish ) ;

  zimt::pass_through < float , 3 , L > pass3 ;
  zimt::storer < float , 3 , 2 , L > store ( output ) ;

  zimt::process ( output.shape , zip , pass3 , store ) ;
}

END_ZIMT_SIMD_NAMESPACE
HWY_AFTER_NAMESPACE() ;

#endif // sentinel
