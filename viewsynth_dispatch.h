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

// this header defines class dispatch_base, which is used to dispatch to
// SIMD-ISA-specific code. dispatch_base has pure virtual member functions
// for the parts of the pipeline which do per-pixel work: the plane warp
// engine, the colour conversions, the baseline model's blend and the
// output compositor. ISA-specific derived 'dispatch'
// classes, defined in viewsynth_payload.cc, implement them. The session
// only ever sees a dispatch_base pointer, obtained via get_dispatch.

#ifndef VIEWSYNTH_DISPATCH_H
#define VIEWSYNTH_DISPATCH_H

#include <vector>

#include "common.h"
#include "planes.h"

namespace viewsynth
{

struct dispatch_base
{
  // 'backend' holds a value indicating which of zimt's back-end
  // libraries is used. 'hwy_isa' is only set when the highway
  // backend is used and holds highway's HWY_TARGET value for
  // the given nested namespace.

  int backend = -1 ;
  unsigned long hwy_isa = 0 ;

  virtual ~dispatch_base() {}

  // warp the source planes into the target layout and unwarp them into
  // their canonical frames. Returns the number of degenerate fits or
  // -1 if the arguments don't fit together.

  virtual int warp_unwarp_planes ( plane_stack_t & src ,
                                   const plane_layout_t & src_layout ,
                                   const plane_layout_t & dst_layout ,
                                   plane_stack_t & warped ,
                                   plane_stack_t & unwarped ) const = 0 ;

  // mask the synthesized image with the sketch's silhouette and tile
  // the display frame. 'synth' is modified.

  virtual bool composite ( image_t & synth ,
                           image_t & sketch ,
                           image_t & central ,
                           image_t & source ,
                           image_t & frame ) const = 0 ;

  // colour conversion of whole images to the synthesis model's input
  // range, and back to sRGB. 'trg' may be a strided view.

  virtual void encode ( image_view_t src ,
                        image_view_t trg ,
                        colour_space_t mode ) const = 0 ;

  virtual void decode ( image_view_t image ,
                        colour_space_t mode ) const = 0 ;

  // the baseline model's blend of the warped planes over the sketch

  virtual void blend ( const std::vector < image_view_t > & planes ,
                       image_view_t sketch ,
                       const px_t & empty ,
                       image_view_t output ) const = 0 ;
} ;

// get_dispatch will yield a dispatch_base pointer to the ISA-specific
// code best suited for the CPU currently running the code.

extern const dispatch_base * const get_dispatch() ;

} ; // namespace viewsynth

#endif // VIEWSYNTH_DISPATCH_H
