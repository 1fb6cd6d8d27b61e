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

// The frame sink receives the composited display frame. 'show' is
// called on every successful tick, 'persist' when the operator asks
// for the current frame to be dumped.

#ifndef VIEWSYNTH_FRAME_SINK_H
#define VIEWSYNTH_FRAME_SINK_H

#include <string>

#include "common.h"

namespace viewsynth
{

struct frame_sink_t
{
  virtual ~frame_sink_t() {}

  virtual bool show ( image_view_t frame ) = 0 ;

  // store the frame under the given file name stem. Returns false
  // on failure.

  virtual bool persist ( image_view_t frame , const std::string & stem ) = 0 ;
} ;

// writes frames to image files with OpenImageIO. If 'preview' is not
// empty, every shown frame overwrites that file, so an image viewer
// which watches the file shows the live frame. Dumped frames go to
// <dump_dir>/<stem>.png as 8-bit RGB.

struct image_file_sink_t
: public frame_sink_t
{
  std::string dump_dir ;
  std::string preview ;

  image_file_sink_t ( const std::string & _dump_dir ,
                      const std::string & _preview )
  : dump_dir ( _dump_dir ) ,
    preview ( _preview )
  { }

  std::string dump_path ( const std::string & stem ) const
  {
    return dump_dir + "/" + stem + ".png" ;
  }

  bool show ( image_view_t frame ) ;

  bool persist ( image_view_t frame , const std::string & stem ) ;
} ;

} ; // namespace viewsynth

#endif // VIEWSYNTH_FRAME_SINK_H
