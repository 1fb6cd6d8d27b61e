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

// The output compositor. The synthesis model produces data for the
// whole frame, also outside the object, where it tends to extrapolate
// nonsense. We use the rendered normal image - the 'sketch' - to find
// the object's silhouette: the renderer paints the background pure
// black, and no surface normal yields an all-zero colour. Outside the
// silhouette, the synthesized image is set to white. Then the sketch,
// the central reference, the masked synthesis and the source image are
// placed side by side to form the display frame.

#include "zimt/zimt.h"
#include "common.h"

#if defined(VIEWSYNTH_COMPOSITE_H) == defined(HWY_TARGET_TOGGLE)
  #ifdef VIEWSYNTH_COMPOSITE_H
    #undef VIEWSYNTH_COMPOSITE_H
  #else
    #define VIEWSYNTH_COMPOSITE_H
  #endif

HWY_BEFORE_NAMESPACE() ;
BEGIN_ZIMT_SIMD_NAMESPACE(viewsynth)

// the value background pixels receive in the masked synthesis

const float background_value = 1.0f ;

// background_test_t yields 1 for pixels which are exactly black and
// 0 for all others.

template < std::size_t L >
struct background_test_t
: public zimt::unary_functor < zimt::xel_t < float , 3 > ,
                               zimt::xel_t < float , 1 > ,
                               L >
{
  template < typename I , typename O >
  void eval ( const I & in , O & out )
  {
    out = 0.0f ;
    out (    ( in[0] == 0.0f )
          && ( in[1] == 0.0f )
          && ( in[2] == 0.0f ) ) = 1.0f ;
  }
} ;

// produce the silhouette mask from the sketch. The mask is 1 for
// background pixels and 0 inside the object's silhouette.

template < std::size_t L = LANES >
void silhouette_mask ( image_t & sketch , mask_t & mask )
{
  zimt::loader < float , 3 , 2 , L > ld ( sketch ) ;
  background_test_t < L > act ;
  zimt::storer < float , 1 , 2 , L > st ( mask ) ;
  zimt::process ( sketch.shape , ld , act , st ) ;
}

// set all background pixels of 'image' to background_value, leave
// the others untouched.

template < std::size_t L = LANES >
void apply_mask ( image_t & image , mask_t & mask )
{
  typedef zimt::simdized_type < px_t , L > px_v ;
  typedef zimt::simdized_type < float , L > f_v ;

  // we set up two loaders, one for the image, one for the mask

  zimt::loader < float , 3 , 2 , L > ldpx ( image ) ;
  zimt::loader < float , 1 , 2 , L > ldm ( mask ) ;

  // the synopsis-forming lambda paints background pixels

  auto syn = [] ( const px_v & v1 , const f_v & v2 ,
                  px_v & v3 , std::size_t cap = L )
  {
    v3 = v1 ;
    v3 ( v2 > 0.5f ) = background_value ;
  } ;

  zimt::zip_t < float , 3 , 2 , L , decltype ( syn ) ,
                float , 1 , float , 3 > zip ( ldpx , ldm , syn ) ;

  zimt::pass_through < float , 3 , L > pass ;

  // the result goes back into the image

  zimt::storer < float , 3 , 2 , L > store ( image ) ;

  zimt::process ( image.shape , zip , pass , store ) ;
}

// place the four images side by side. All four must have the same
// shape { w , h }, the frame must be { 4 * w , h }. Returns false
// if the shapes don't match.

template < typename dummy = void >
bool tile_frame ( image_t & sketch ,
                  image_t & central ,
                  image_t & masked ,
                  image_t & source ,
                  image_t & frame )
{
  long w = sketch.shape[0] ;
  long h = sketch.shape[1] ;

  if (    central.shape != sketch.shape
       || masked.shape != sketch.shape
       || source.shape != sketch.shape
       || frame.shape[0] != std::size_t ( 4 * w )
       || frame.shape[1] != std::size_t ( h ) )
  {
    std::cerr << "tile_frame: shape mismatch" << std::endl ;
    return false ;
  }

  image_t * p_tile [ 4 ] { &sketch , &central , &masked , &source } ;

  for ( long i = 0 ; i < 4 ; i++ )
  {
    auto tile = frame.window ( { i * w , 0L } , { ( i + 1 ) * w , h } ) ;
    tile.copy_data ( *( p_tile [ i ] ) ) ;
  }
  return true ;
}

// the complete compositing step: mask the synthesis using the sketch's
// silhouette, then tile the frame. The synthesized image is modified.

template < std::size_t L = LANES >
bool composite_frame ( image_t & synth ,
                       image_t & sketch ,
                       image_t & central ,
                       image_t & source ,
                       image_t & frame )
{
  if ( synth.shape != sketch.shape )
  {
    std::cerr << "composite_frame: synthesis and sketch differ in shape"
              << std::endl ;
    return false ;
  }

  mask_t mask ( sketch.shape ) ;
  silhouette_mask < L > ( sketch , mask ) ;
  apply_mask < L > ( synth , mask ) ;
  return tile_frame ( sketch , central , synth , source , frame ) ;
}

END_ZIMT_SIMD_NAMESPACE
HWY_AFTER_NAMESPACE() ;

#endif // sentinel
