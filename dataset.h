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

// The texture dataset provides the 'examples' the session draws it's
// appearance information from. Each example is one photograph of an
// object of the class, together with a 'central' reference crop and
// the object's planes as seen in that photograph: one image patch per
// plane, with the plane's keypoints and a visibility flag.
// On disk, every example is a sub-directory of the dataset directory,
// holding the images and a 'meta.yaml' file:
//
//   src_image: source.png
//   central: central.png
//   planes:
//     - image: plane_0.png
//       visible: true
//       kpoints: [ [ -0.5 , -0.5 ] , [ 0.5 , -0.5 ] ,
//                  [ 0.5 , 0.5 ] , [ -0.5 , 0.5 ] ]
//     - visible: false
//     ...
//
// The 'planes' sequence has one entry per plane of the class, in the
// canonical order. Keypoints are given in normalized image coordinates
// of the plane image. Invisible planes need no image and are zero-filled.

#ifndef VIEWSYNTH_DATASET_H
#define VIEWSYNTH_DATASET_H

#include <memory>
#include <string>
#include <vector>

#include "planes.h"

namespace viewsynth
{

struct texture_example_t
{
  std::string name ;
  image_t src_image ;
  image_t central ;
  plane_stack_t planes ;
  plane_layout_t layout ;

  texture_example_t ( std::size_t w , std::size_t h , std::size_t n )
  : src_image ( shape_type { w , h } ) ,
    central ( shape_type { w , h } ) ,
    planes ( zimt::xel_t < std::size_t , 3 > { w , h , n } )
  {
    layout.resize ( n ) ;
  }
} ;

typedef std::shared_ptr < texture_example_t > example_ptr_t ;

struct texture_source_t
{
  virtual ~texture_source_t() {}

  virtual std::size_t size() const = 0 ;

  // load the example at 'index'. Returns false on failure, then
  // 'example' is left unchanged.

  virtual bool load ( std::size_t index , example_ptr_t & example ) = 0 ;
} ;

struct texture_dataset_t
: public texture_source_t
{
  std::string directory ;
  object_class_t cls ;
  int frame_size ;
  bool fast_load ;

  // the record directories, sorted

  std::vector < std::string > records ;

  texture_dataset_t ( const std::string & _directory ,
                      object_class_t _cls ,
                      int _frame_size ,
                      bool _fast_load )
  : directory ( _directory ) ,
    cls ( _cls ) ,
    frame_size ( _frame_size ) ,
    fast_load ( _fast_load )
  { }

  // scan the dataset directory for records. Only sub-directories with
  // a meta.yaml file count. Returns false if there are none.

  bool scan() ;

  std::size_t size() const
  {
    return records.size() ;
  }

  bool load ( std::size_t index , example_ptr_t & example ) ;
} ;

} ; // namespace viewsynth

#endif // VIEWSYNTH_DATASET_H
