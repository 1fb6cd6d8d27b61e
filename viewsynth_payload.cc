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

// This file has the SIMD-ISA-specific code of viewsynth. It can be
// compiled in two ways: as a single-ISA TU, where the ISA is fixed at
// compile time by the compiler flags, or - with MULTI_SIMD_ISA defined -
// using highway's foreach_target mechanism, which re-includes this file
// once per ISA highway supports on the build platform. The remainder
// of the program is ISA-agnostic and reaches the code in here through
// a dispatch_base pointer obtained from get_dispatch.

#ifdef MULTI_SIMD_ISA

// tell the foreach_target mechanism which file should be repeatedly
// re-included and re-compiled with SIMD-ISA-specific flags

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "viewsynth_payload.cc"  // this very file

#include <hwy/foreach_target.h>  // must come before highway.h
#include <hwy/highway.h>

#endif // #ifdef MULTI_SIMD_ISA

#include "zimt/zimt.h"
#include "viewsynth_dispatch.h"

// the SIMD headers. These are guarded with toggling sentinels, so they
// are re-included for every ISA.

#include "warp.h"
#include "colour.h"
#include "blend.h"
#include "composite.h"

HWY_BEFORE_NAMESPACE() ;

BEGIN_ZIMT_SIMD_NAMESPACE(viewsynth)

// Here, we define the SIMD-ISA-specific derived 'dispatch' class:

struct dispatch
: public dispatch_base
{
  // We fit the derived dispatch class with a c'tor which fills in
  // information about the nested SIMD ISA we're currently in.

  dispatch()
  {
    backend = int ( zimt::simdized_type<int,4>::backend ) ;
    #if defined USE_HWY || defined MULTI_SIMD_ISA
      hwy_isa = HWY_TARGET ;
    #endif

    if ( args.verbose )
    {
      std::cout << "pixel pipeline is using back-end: "
                << zimt::backend_name [ backend ] << std::endl ;

      #if defined USE_HWY || defined MULTI_SIMD_ISA

      std::cout << "highway target: "
                << hwy::TargetName ( hwy_isa ) << std::endl ;

      #endif
    }
  }

  int warp_unwarp_planes ( plane_stack_t & src ,
                           const plane_layout_t & src_layout ,
                           const plane_layout_t & dst_layout ,
                           plane_stack_t & warped ,
                           plane_stack_t & unwarped ) const
  {
    return warp_planes < LANES >
             ( src , src_layout , dst_layout , warped , unwarped ) ;
  }

  bool composite ( image_t & synth ,
                   image_t & sketch ,
                   image_t & central ,
                   image_t & source ,
                   image_t & frame ) const
  {
    return composite_frame < LANES >
             ( synth , sketch , central , source , frame ) ;
  }

  void encode ( image_view_t src ,
                image_view_t trg ,
                colour_space_t mode ) const
  {
    encode_image < LANES > ( src , trg , mode ) ;
  }

  void decode ( image_view_t image , colour_space_t mode ) const
  {
    decode_image < LANES > ( image , mode ) ;
  }

  void blend ( const std::vector < image_view_t > & planes ,
               image_view_t sketch ,
               const px_t & empty ,
               image_view_t output ) const
  {
    blend_planes < LANES > ( planes , sketch , empty , output ) ;
  }
} ;

// _get_dispatch returns a pointer to 'dispatch_base', which points to
// an object of the derived class 'dispatch'. This is used with highway's
// HWY_DYNAMIC_DISPATCH and returns the dispatch pointer for the SIMD ISA
// which highway deems most appropriate for the CPU on which the code
// is currently running.

const dispatch_base * const _get_dispatch()
{
  static dispatch d ;
  return &d ;
}

END_ZIMT_SIMD_NAMESPACE

HWY_AFTER_NAMESPACE() ;

// Now for code which isn't SIMD-ISA-specific. ZIMT_ONCE is defined
// as either HWY_ONCE (if MULTI_SIMD_ISA is #defined) or simply true
// otherwise - then, there is only one compilation anyway.

#if ZIMT_ONCE

namespace viewsynth {

#ifdef MULTI_SIMD_ISA

HWY_EXPORT(_get_dispatch);

const dispatch_base * const get_dispatch()
{
  return HWY_DYNAMIC_DISPATCH(_get_dispatch)() ;
}

#else // #ifdef MULTI_SIMD_ISA

const dispatch_base * const get_dispatch()
{
  return zsimd::_get_dispatch() ;
}

#endif // #ifdef MULTI_SIMD_ISA

}  // namespace viewsynth

#endif  // ZIMT_ONCE
