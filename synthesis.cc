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

// implementation of the baseline synthesis model

#include "assemble.h"
#include "synthesis.h"
#include "viewsynth_dispatch.h"

namespace viewsynth
{

composite_model_t::composite_model_t ( object_class_t _cls ,
                                       colour_space_t mode )
: cls ( _cls ) ,
  empty ( encode_pixel ( px_t { 0.0f , 0.0f , 0.0f } , mode ) )
{ }

bool composite_model_t::synthesize ( tensor_t & input , image_t & output )
{
  std::size_t n = plane_count ( cls ) ;

  if ( input.shape[0] != input_channels ( cls ) )
  {
    std::cerr << "composite model: input has " << input.shape[0]
              << " channels, expected " << input_channels ( cls )
              << std::endl ;
    return false ;
  }

  if (    output.shape[0] != input.shape[1]
       || output.shape[1] != input.shape[2] )
  {
    std::cerr << "composite model: output size doesn't match input"
              << std::endl ;
    return false ;
  }

  auto sketch = tensor_slot ( input , 0 ) ;

  std::vector < image_view_t > planes ;
  for ( std::size_t i = 0 ; i < n ; i++ )
    planes.push_back ( tensor_slot ( input , 2 + i ) ) ;

  get_dispatch()->blend ( planes , sketch , empty , output ) ;
  return true ;
}

} ; // namespace viewsynth
