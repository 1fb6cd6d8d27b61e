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

// The synthesis input assembler stacks the images the synthesis model
// looks at into one multi-channel 'tensor': the sketch (the rendered
// normal image), the central reference crop and the warped planes, in
// this order and three channels each. The data are converted to the
// model's colour space and normalized to [-1,1].

#ifndef VIEWSYNTH_ASSEMBLE_H
#define VIEWSYNTH_ASSEMBLE_H

#include "common.h"

namespace viewsynth
{

// colour conversion of a single pixel. RGB is sRGB in [0,1], Lab
// uses the D65 white point; L in [0,100], a and b roughly in
// [-128,127].

px_t rgb_to_lab ( const px_t & rgb ) ;
px_t lab_to_rgb ( const px_t & lab ) ;

// map a pixel to the model's normalized range [-1,1] and back. For
// CS_LAB, the pixel is converted from/to Lab as well.

px_t encode_pixel ( const px_t & rgb , colour_space_t mode ) ;
px_t decode_pixel ( const px_t & code , colour_space_t mode ) ;

// assemble the model input. 'tensor' must have the shape
// { input_channels ( cls ) , w , h }. Returns false if it hasn't, if
// the images differ in size or if the stack doesn't hold exactly
// plane_count ( cls ) images.

bool assemble_input ( object_class_t cls ,
                      image_t & sketch ,
                      image_t & central ,
                      plane_stack_t & warped ,
                      colour_space_t mode ,
                      tensor_t & tensor ) ;

// convert a model output - in the normalized model colour space - to
// displayable RGB in [0,1], in place.

void decode_output ( image_t & image , colour_space_t mode ) ;

} ; // namespace viewsynth

#endif // VIEWSYNTH_ASSEMBLE_H
