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

// this header has code common to the entire program, like common types.
// The pixel data we process are held in zimt arrays. We use float
// pixels with three channels throughout, values in [0,1] for RGB
// data. A 'stack' of images - like the set of plane images - is a
// 3D array where the third axis counts the images.

#ifndef VIEWSYNTH_COMMON_H
#define VIEWSYNTH_COMMON_H

#include <string>

#include "zimt/common.h"
#include "zimt/xel.h"
#include "zimt/array.h"

#include "viewsynth_basic.h"

namespace viewsynth
{

typedef zimt::xel_t < std::size_t , 2 > shape_type ;

typedef zimt::xel_t < float , 2 > v2_t ;
typedef zimt::xel_t < float , 3 > px_t ;

typedef zimt::array_t < 2 , px_t > image_t ;
typedef zimt::view_t < 2 , px_t > image_view_t ;

// a stack of N images, shape { w , h , N }

typedef zimt::array_t < 3 , px_t > plane_stack_t ;

// single-channel 2D data, used for masks

typedef zimt::array_t < 2 , float > mask_t ;

// the synthesis model's input: shape { C , w , h }, so the channels
// of one pixel are adjacent in memory.

typedef zimt::array_t < 3 , float > tensor_t ;

// I use 16 SIMD lanes for now.

#define LANES 16

// get a 2D view to the i-th image in a stack

inline image_view_t stack_slice ( plane_stack_t & stack , std::size_t i )
{
  return image_view_t ( stack.data() + i * stack.strides[2] ,
                        { stack.strides[0] , stack.strides[1] } ,
                        { stack.shape[0] , stack.shape[1] } ) ;
}

// get a 2D view of pixels to the channel triplet starting at channel
// 3 * k in a tensor. Since the number of channels is always a multiple
// of three, we can reinterpret the float data as three-channel pixels,
// with appropriately scaled-down strides.

inline image_view_t tensor_slot ( tensor_t & tensor , std::size_t k )
{
  px_t * p_base = (px_t*) ( tensor.data() ) ;
  return image_view_t ( p_base + k ,
                        { tensor.strides[1] / 3 , tensor.strides[2] / 3 } ,
                        { tensor.shape[1] , tensor.shape[2] } ) ;
}

// image file I/O via OpenImageIO. read_image loads an image of any
// size and channel count and produces three-channel float data of
// the target's size: single-channel images are replicated, an alpha
// channel is ignored and the image is resized if it's size differs.
// save_image stores three-channel float data to any format OIIO can
// write. For 8-bit formats, the data are quantized. Both functions
// report problems on std::cerr and return false.

bool read_image ( const std::string & filename , image_view_t trg ) ;

bool save_image ( const std::string & filename , image_view_t pixels ) ;

} ; // namespace viewsynth

#endif // VIEWSYNTH_COMMON_H
