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

// this header has basic enums and types which do not depend on zimt,
// and declarations of some helper functions which don't use zimt.

#ifndef VIEWSYNTH_BASIC_H
#define VIEWSYNTH_BASIC_H

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace viewsynth
{

// the object classes we can handle. Each class comes with it's own
// set of semantic keypoints and it's own set of 'planes'.

typedef enum
{
  CLS_CAR ,
  CLS_CHAIR ,
  CLS_NONE
} object_class_t ;

const char * const object_class_name[]
{
  "car" ,
  "chair" ,
  "unsupported"
} ;

object_class_t parse_object_class ( const std::string & name ) ;

// a 'plane' is a planar surface region of the object - like a car's
// side or a chair's seat - which is defined by three or four of the
// class' keypoints. The keypoint names are given in the order top
// left, top right, bottom right, bottom left, as the plane is seen
// from outside the object. This is the order used to set up the
// plane's canonical frame, and it is also the winding order which
// identifies a plane as front-facing.

struct plane_def_t
{
  std::string name ;
  std::vector < std::string > kpoints ;
} ;

// the fixed plane set for a given class, in canonical order. Source
// and target layouts always use this sequence, so the i-th plane of
// a source layout is warped to the i-th plane of the target layout.

const std::vector < plane_def_t > & plane_defs ( object_class_t cls ) ;

std::size_t plane_count ( object_class_t cls ) ;

// the synthesis model's input has three channels for the sketch, three
// for the 'central' reference image and three for every plane.

std::size_t input_channels ( object_class_t cls ) ;

// the CAD catalog holds this many models per class. next_model wraps
// around at this value.

const int catalog_size = 10 ;

// in fast-load ('demo') mode, only this many dataset records are used

const std::size_t fast_load_records = 100 ;

// the closed set of events which the session state machine consumes.
// EV_NONE stands for input which has no binding: it's rejected by the
// state machine as an unsupported event.

typedef enum
{
  EV_ROTATE_UP ,
  EV_ROTATE_DOWN ,
  EV_ROTATE_LEFT ,
  EV_ROTATE_RIGHT ,
  EV_ZOOM_IN ,
  EV_ZOOM_OUT ,
  EV_NEXT_EXAMPLE ,
  EV_NEXT_MODEL ,
  EV_DUMP_FRAME ,
  EV_NO_OP ,
  EV_NONE
} event_t ;

const char * const event_name[]
{
  "rotate_up" ,
  "rotate_down" ,
  "rotate_left" ,
  "rotate_right" ,
  "zoom_in" ,
  "zoom_out" ,
  "next_example" ,
  "next_model" ,
  "dump_frame" ,
  "no_op" ,
  "unsupported"
} ;

// translate a key code (as read from the terminal) to an event.
// Letters are accepted in upper and lower case.

event_t key_to_event ( int key ) ;

// the text printed at startup to explain the key bindings

extern const char * const key_help ;

// outcome of a single session tick

typedef enum
{
  TICK_OK ,
  TICK_UNSUPPORTED_EVENT ,
  TICK_COLLABORATOR_FAILURE
} tick_status_t ;

const char * const tick_status_name[]
{
  "ok" ,
  "unsupported event" ,
  "collaborator failure"
} ;

// colour space in which the synthesis model receives it's input

typedef enum
{
  CS_RGB ,
  CS_LAB ,
  CS_NONE
} colour_space_t ;

const char * const colour_space_name[]
{
  "rgb" ,
  "lab" ,
  "unsupported"
} ;

// produce the file name stem used for dumped frames, like
// 003_el_010_az_095_rad_007

std::string dump_name ( int dump_id , int elevation ,
                        int azimuth , int radius ) ;

// the 'arguments' object holds the program's configuration as gleaned
// from the command line. There is only one of it, 'args', and it's
// never changed after it has been filled in by 'init'.

struct arguments
{
  bool verbose = false ;
  std::string class_str ;
  object_class_t object_class = CLS_NONE ;
  std::string dataset_dir ;
  std::string model ;
  std::string cad_root ;
  std::string dump_dir ;
  std::string device ;
  std::string preview ;
  int size = 128 ;
  double focal = 1000.0 ;
  bool demo = false ;

  // the 'arguments' object's 'init' takes the main program's argc
  // and argv. Configuration errors are fatal: init reports them and
  // terminates the program.

  void init ( int argc , const char ** argv ) ;
} ;

extern arguments args ;

} ; // namespace viewsynth

#endif // VIEWSYNTH_BASIC_H
