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

// The synthesis model maps the assembled input tensor to an image. The
// session only knows the abstract interface. We provide a deterministic
// baseline, 'composite', which blends the warped planes and uses the
// sketch where no plane has content. A learned model would be another
// class derived from synthesis_model_t.

#ifndef VIEWSYNTH_SYNTHESIS_H
#define VIEWSYNTH_SYNTHESIS_H

#include "common.h"

namespace viewsynth
{

struct synthesis_model_t
{
  virtual ~synthesis_model_t() {}

  // produce an image from the input tensor. The output stays in the
  // model's normalized colour space. 'output' must have the tensor's
  // spatial shape. Returns false on failure.

  virtual bool synthesize ( tensor_t & input , image_t & output ) = 0 ;
} ;

struct composite_model_t
: public synthesis_model_t
{
  object_class_t cls ;

  // the encoding of a black pixel, which is what the warp engine
  // produces where a plane has no content

  px_t empty ;

  composite_model_t ( object_class_t _cls , colour_space_t mode ) ;

  bool synthesize ( tensor_t & input , image_t & output ) ;
} ;

} ; // namespace viewsynth

#endif // VIEWSYNTH_SYNTHESIS_H
