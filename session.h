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

// The session state machine. It owns the session state and consumes
// one event per tick. Every consumed event - also no_op and dump_frame -
// is followed by a complete pass through the pipeline:
//
//   viewpoint -> camera pose -> sketch rendering -> keypoint projection
//   -> plane resolution -> warp/unwarp -> input assembly -> synthesis
//   -> compositing -> frame sink
//
// The collaborators (renderer, mesh store, dataset, visibility predicate,
// synthesis model and frame sink) are referenced, not owned: they must
// outlive the session.

#ifndef VIEWSYNTH_SESSION_H
#define VIEWSYNTH_SESSION_H

#include "cad.h"
#include "dataset.h"
#include "frame_sink.h"
#include "planes.h"
#include "render.h"
#include "synthesis.h"
#include "viewsynth_dispatch.h"

namespace viewsynth
{

typedef enum
{
  ST_IDLE ,
  ST_AWAITING_RENDER ,
  ST_NONE
} machine_state_t ;

struct collaborators_t
{
  renderer_t * p_renderer = nullptr ;
  mesh_store_t * p_mesh_store = nullptr ;
  texture_source_t * p_dataset = nullptr ;
  const visibility_predicate_t * p_visibility = nullptr ;
  synthesis_model_t * p_model = nullptr ;
  frame_sink_t * p_sink = nullptr ;
} ;

// everything which changes during a session is in here

struct session_state_t
{
  view_controls_t controls ;
  int cad_idx = 0 ;
  std::size_t dataset_index = 0 ;
  int dump_id = 0 ;

  kpoint3_map_t kp3 ;
  scene_t scene ;
  example_ptr_t example ;

  // the most recent frame the sink has shown, shape { 4 * w , h }

  image_t last_frame ;
  bool has_frame = false ;

  machine_state_t machine = ST_IDLE ;

  session_state_t ( std::size_t size )
  : last_frame ( shape_type { 4 * size , size } )
  { }
} ;

struct session_t
{
  object_class_t cls ;
  std::size_t size ;
  colour_space_t colour_mode ;
  collaborators_t collab ;
  const dispatch_base * p_dispatch ;

  session_state_t state ;

  // InvalidGeometry count of the most recent pipeline pass: keypoints
  // clamped to the camera plane plus degenerate plane fits

  int geometry_warnings = 0 ;

  // per-pass work data

  image_t sketch ;
  kpoint2_map_t kp2 ;
  plane_layout_t target_layout ;
  plane_stack_t warped ;
  plane_stack_t unwarped ;
  tensor_t input ;
  image_t synth ;
  image_t frame ;

  session_t ( object_class_t _cls ,
              std::size_t _size ,
              double focal ,
              const collaborators_t & _collab ,
              colour_space_t _colour_mode = CS_LAB ) ;

  // load CAD model 0 and the first dataset example, then run the first
  // pipeline pass. Returns false if any of these steps fails.

  bool start() ;

  // consume one event and re-render

  tick_status_t tick ( event_t event ) ;

  viewpoint_t viewpoint() const ;

  camera_pose_t pose() const ;

  // the stem under which dump_frame would store the current frame

  std::string current_dump_name() const ;

  // the single transition function: apply the event's state change.
  // Returns TICK_UNSUPPORTED_EVENT for events it doesn't know, leaving
  // the state untouched, and TICK_COLLABORATOR_FAILURE if a load or
  // the dump fails.

  tick_status_t apply_event ( event_t event ) ;

  bool load_model ( int idx ) ;

  bool next_example() ;

  bool dump_frame() ;

  // the pipeline pass. On failure, the previous frame stays current.

  bool render_pass() ;
} ;

} ; // namespace viewsynth

#endif // VIEWSYNTH_SESSION_H
