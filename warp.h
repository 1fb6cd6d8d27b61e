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

// This header has the plane warp engine. Each plane of the object comes
// as an image patch together with the positions of it's defining
// keypoints in that image. To 'warp' a plane, we fit a planar transform
// which maps the target keypoint positions to the source keypoint
// positions and use it to pull pixels from the source patch for every
// pixel of the target frame. To 'unwarp' a plane, we do the same with
// the corners of the target frame as target positions: this produces
// the plane in it's own canonical, undistorted frame.
// The resampling is done with zimt: a linspace_t 'get_t' object yields
// the discrete target coordinates, a plane_lookup_t applies the
// transform and picks up source pixels from a b-spline of degree one
// (so, bilinear interpolation), and a storer deposits the result in
// the target image. Lookups which fall outside the source patch, or
// which land behind the transform's horizon line, produce black.

#include "zimt/zimt.h"
#include "homography.h"
#include "planes.h"

#if defined(VIEWSYNTH_WARP_H) == defined(HWY_TARGET_TOGGLE)
  #ifdef VIEWSYNTH_WARP_H
    #undef VIEWSYNTH_WARP_H
  #else
    #define VIEWSYNTH_WARP_H
  #endif

#include "zimt/bspline.h"
#include "zimt/eval.h"

HWY_BEFORE_NAMESPACE() ;
BEGIN_ZIMT_SIMD_NAMESPACE(viewsynth)

template < std::size_t L >
struct plane_lookup_t
: public zimt::unary_functor < zimt::xel_t < float , 2 > ,
                               zimt::xel_t < float , 3 > ,
                               L
                             >
{
  typedef zimt::unary_functor < zimt::xel_t < float , 2 > ,
                                zimt::xel_t < float , 3 > ,
                                L
                              > base_t ;

  typedef zimt::xel_t < float , 2 > crd_t ;
  typedef zimt::simdized_type < crd_t , L > crd_v ;
  typedef zimt::simdized_type < px_t , L > px_v ;

  using typename base_t::in_v ;
  using typename base_t::in_ele_v ;
  typedef typename in_ele_v::mask_type mask_t ;

  typedef zimt::bspline < px_t , 2 > spl_t ;

  float h [ 9 ] ;
  float w_sign ;
  float x_max , y_max ;

  std::shared_ptr < spl_t > p_bspl ;
  zimt::grok_type < crd_t , px_t , L > ev ;

  // a coordinate which is always inside the source patch. It's used
  // in lanes which are masked out, to avoid evaluating the spline at
  // arbitrary (possibly NaN) locations.

  crd_t safe_crd { 0.0f , 0.0f } ;

  // 'w_sign' is the sign of the homogeneous coordinate w for points
  // inside the target quadrilateral. Points where w has the opposite
  // sign are on the far side of the horizon line and must not pick
  // up data.

  plane_lookup_t ( const plane_transform_t & tf ,
                   std::shared_ptr < spl_t > _p_bspl ,
                   float _w_sign )
  : w_sign ( _w_sign ) ,
    p_bspl ( _p_bspl ) ,
    ev ( zimt::make_safe_evaluator < spl_t , float , L > ( *_p_bspl ) )
  {
    for ( int i = 0 ; i < 9 ; i++ )
      h [ i ] = tf.h [ i ] ;

    x_max = _p_bspl->core.shape[0] - .5f ;
    y_max = _p_bspl->core.shape[1] - .5f ;
  }

  void eval ( const in_v & in , px_v & px )
  {
    crd_v crd ;

    auto w = in[0] * h[6] + in[1] * h[7] + h[8] ;
    crd[0] = ( in[0] * h[0] + in[1] * h[1] + h[2] ) / w ;
    crd[1] = ( in[0] * h[3] + in[1] * h[4] + h[5] ) / w ;

    auto mask =    ( w * w_sign > 0.0f )
                && ( crd[0] >= -.5f )
                && ( crd[0] <= x_max )
                && ( crd[1] >= -.5f )
                && ( crd[1] <= y_max ) ;

    if ( none_of ( mask ) )
    {
      px = 0.0f ;
      return ;
    }

    crd ( ! mask ) = safe_crd ;
    ev.eval ( crd , px ) ;

    // mask out 'misses' to all-zero

    if ( ! all_of ( mask ) )
    {
      px ( ! mask ) = 0.0f ;
    }
  }
} ;

// convert a set of keypoints in normalized image coordinates to pixel
// coordinates of a frame with the given width and height

template < typename dummy = void >
std::vector < v2_t > to_pixel ( const std::vector < v2_t > & kpoints ,
                                std::size_t width ,
                                std::size_t height )
{
  std::vector < v2_t > result ;
  for ( const auto & p : kpoints )
  {
    result.push_back ( v2_t { float ( normalized_to_pixel ( p[0] , width ) ) ,
                              float ( normalized_to_pixel ( p[1] , height ) ) } ) ;
  }
  return result ;
}

// the plane's canonical frame: it's first keypoints (top left, top
// right, bottom right, bottom left) coincide with the corners of the
// target frame. We only have canonical positions for three and four
// keypoints.

template < typename dummy = void >
std::vector < v2_t > canonical_corners ( std::size_t npoints ,
                                         std::size_t width ,
                                         std::size_t height )
{
  float x1 = width - .5f ;
  float y1 = height - .5f ;

  std::vector < v2_t > corners { { -.5f , -.5f } , { x1 , -.5f } ,
                                 { x1 , y1 } , { -.5f , y1 } } ;

  if ( npoints == 3 )
    corners.pop_back() ;
  else if ( npoints != 4 )
    corners.clear() ;

  return corners ;
}

// resample the source patch held in the b-spline into 'trg', pulling
// pixels through the transform 'tf' (target pixel -> source pixel).
// 'trg_points' are the target positions the transform was fitted to,
// we use their centroid to find out which side of the horizon line
// is the valid one.

template < std::size_t L >
void resample_plane ( std::shared_ptr < zimt::bspline < px_t , 2 > > p_bspl ,
                      const plane_transform_t & tf ,
                      const std::vector < v2_t > & trg_points ,
                      image_view_t & trg )
{
  v2_t center { 0.0f , 0.0f } ;
  for ( const auto & p : trg_points )
    center += p ;
  center /= float ( trg_points.size() ) ;

  float w = tf.h[6] * center[0] + tf.h[7] * center[1] + tf.h[8] ;
  float w_sign = ( w < 0.0f ) ? -1.0f : 1.0f ;

  plane_lookup_t < L > act ( tf , p_bspl , w_sign ) ;

  zimt::linspace_t < float , 2 , 2 , L > ls ( { 0.0f , 0.0f } ,
                                              { 1.0f , 1.0f } ) ;

  zimt::storer < float , 3 , 2 , L > st ( trg ) ;

  zimt::process ( trg.shape , ls , act , st ) ;
}

// The warp engine proper. For every plane i, in canonical order:
// - warped[i] receives the source patch warped into the target layout
//   if the plane is visible in both source and target, and zero else.
// - unwarped[i] receives the source patch in it's canonical frame if
//   the plane is visible in the source, and zero else.
// Both stacks always receive exactly N images, N being the number of
// planes. If a transform can't be fitted (near-collinear keypoints),
// the source patch is passed through unchanged.
// The return value is the number of failed fits, or -1 if the shapes
// of the arguments don't match.

template < std::size_t L = LANES >
int warp_planes ( plane_stack_t & src ,
                  const plane_layout_t & src_layout ,
                  const plane_layout_t & dst_layout ,
                  plane_stack_t & warped ,
                  plane_stack_t & unwarped )
{
  typedef zimt::bspline < px_t , 2 > spl_t ;

  std::size_t n = src.shape[2] ;

  if (    src_layout.size() != n
       || dst_layout.size() != n
       || warped.shape != src.shape
       || unwarped.shape != src.shape )
  {
    std::cerr << "warp_planes: shape mismatch, " << n
              << " source planes, source layout " << src_layout.size()
              << ", target layout " << dst_layout.size() << std::endl ;
    return -1 ;
  }

  std::size_t w = src.shape[0] ;
  std::size_t h = src.shape[1] ;

  px_t blank ;
  blank = 0.0f ;

  int failed = 0 ;

  for ( std::size_t i = 0 ; i < n ; i++ )
  {
    auto src_i = stack_slice ( src , i ) ;
    auto warped_i = stack_slice ( warped , i ) ;
    auto unwarped_i = stack_slice ( unwarped , i ) ;

    if ( ! src_layout.visible [ i ] )
    {
      // no information available for this plane

      warped_i.set_data ( blank ) ;
      unwarped_i.set_data ( blank ) ;
      continue ;
    }

    // set up a degree-one b-spline over the source patch. prefilter
    // is a no-op for degree one, but we still need to call it to
    // initialize the spline's frame.

    std::shared_ptr < spl_t > p_bspl
      ( new spl_t ( src_i.shape , 1 , { zimt::REFLECT , zimt::REFLECT } ) ) ;

    p_bspl->core.copy_data ( src_i ) ;
    p_bspl->prefilter() ;

    auto src_px = to_pixel ( src_layout.kpoints [ i ] , w , h ) ;

    // the warp, from the target layout to the source layout

    if ( dst_layout.visible [ i ] )
    {
      auto dst_px = to_pixel ( dst_layout.kpoints [ i ] , w , h ) ;
      plane_transform_t tf ;

      if ( fit_plane_transform ( dst_px , src_px , tf ) )
      {
        resample_plane < L > ( p_bspl , tf , dst_px , warped_i ) ;
      }
      else
      {
        if ( args.verbose )
          std::cout << "plane " << i << ": degenerate warp, using identity"
                    << std::endl ;
        warped_i.copy_data ( src_i ) ;
        ++failed ;
      }
    }
    else
    {
      warped_i.set_data ( blank ) ;
    }

    // the unwarp, from the canonical frame to the source layout

    auto canonical = canonical_corners ( src_px.size() , w , h ) ;
    plane_transform_t tf ;

    if ( fit_plane_transform ( canonical , src_px , tf ) )
    {
      resample_plane < L > ( p_bspl , tf , canonical , unwarped_i ) ;
    }
    else
    {
      if ( args.verbose )
        std::cout << "plane " << i << ": degenerate unwarp, using identity"
                  << std::endl ;
      unwarped_i.copy_data ( src_i ) ;
      ++failed ;
    }
  }

  return failed ;
}

END_ZIMT_SIMD_NAMESPACE
HWY_AFTER_NAMESPACE() ;

#endif // sentinel
