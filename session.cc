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

// implementation of the session state machine

#include "assemble.h"
#include "session.h"

namespace viewsynth
{

session_t::session_t ( object_class_t _cls ,
                       std::size_t _size ,
                       double focal ,
                       const collaborators_t & _collab ,
                       colour_space_t _colour_mode )
: cls ( _cls ) ,
  size ( _size ) ,
  colour_mode ( _colour_mode ) ,
  collab ( _collab ) ,
  p_dispatch ( get_dispatch() ) ,
  state ( _size ) ,
  sketch ( shape_type { _size , _size } ) ,
  warped ( zimt::xel_t < std::size_t , 3 >
            { _size , _size , plane_count ( _cls ) } ) ,
  unwarped ( zimt::xel_t < std::size_t , 3 >
              { _size , _size , plane_count ( _cls ) } ) ,
  input ( zimt::xel_t < std::size_t , 3 >
           { input_channels ( _cls ) , _size , _size } ) ,
  synth ( shape_type { _size , _size } ) ,
  frame ( shape_type { 4 * _size , _size } )
{
  state.controls.focal = focal ;
}

viewpoint_t session_t::viewpoint() const
{
  return to_viewpoint ( state.controls ) ;
}

camera_pose_t session_t::pose() const
{
  return to_camera_pose ( viewpoint() , size , size ) ;
}

// the dump name uses the integer parts of the controls, with the
// azimuth wrapped to [0,360)

std::string session_t::current_dump_name() const
{
  int el = 90 - int ( state.controls.pitch ) ;
  int az = ( int ( state.controls.yaw ) + 90 ) % 360 ;
  if ( az < 0 )
    az += 360 ;
  int rad = int ( state.controls.radius ) ;
  return dump_name ( state.dump_id , el , az , rad ) ;
}

bool session_t::load_model ( int idx )
{
  mesh_t mesh ;
  kpoint3_map_t kp3 ;

  if ( ! collab.p_mesh_store->load ( idx , mesh , kp3 ) )
  {
    std::cerr << "failed to load CAD model " << idx << std::endl ;
    return false ;
  }

  // the sketch shows the normals as colours

  if ( mesh.colours.size() != mesh.vertices.size() )
    compute_vertex_normals ( mesh ) ;

  state.scene.mesh = std::move ( mesh ) ;
  state.kp3 = std::move ( kp3 ) ;
  state.cad_idx = idx ;

  if ( args.verbose )
    std::cout << "CAD model " << idx << ": " << state.kp3.size()
              << " keypoints" << std::endl ;

  return true ;
}

bool session_t::next_example()
{
  std::size_t n = collab.p_dataset->size() ;
  if ( n == 0 )
  {
    std::cerr << "dataset is empty" << std::endl ;
    return false ;
  }

  example_ptr_t example ;
  if ( ! collab.p_dataset->load ( state.dataset_index , example ) )
  {
    std::cerr << "failed to load dataset example " << state.dataset_index
              << std::endl ;
    return false ;
  }

  state.example = example ;
  state.dataset_index = ( state.dataset_index + 1 ) % n ;
  return true ;
}

bool session_t::dump_frame()
{
  if ( ! state.has_frame )
  {
    std::cerr << "no frame to dump yet" << std::endl ;
    return false ;
  }

  if ( ! collab.p_sink->persist ( state.last_frame , current_dump_name() ) )
    return false ;

  ++state.dump_id ;
  return true ;
}

tick_status_t session_t::apply_event ( event_t event )
{
  view_controls_t & c ( state.controls ) ;

  switch ( event )
  {
    case EV_ROTATE_UP :
      c.pitch = clamp_pitch ( c.pitch + angle_step ) ;
      break ;
    case EV_ROTATE_DOWN :
      c.pitch = clamp_pitch ( c.pitch - angle_step ) ;
      break ;
    case EV_ROTATE_RIGHT :
      c.yaw += angle_step ;
      break ;
    case EV_ROTATE_LEFT :
      c.yaw -= angle_step ;
      break ;
    case EV_ZOOM_OUT :
      c.radius = clamp_radius ( c.radius + radius_step ) ;
      break ;
    case EV_ZOOM_IN :
      c.radius = clamp_radius ( c.radius - radius_step ) ;
      break ;
    case EV_NEXT_EXAMPLE :
      if ( ! next_example() )
        return TICK_COLLABORATOR_FAILURE ;
      break ;
    case EV_NEXT_MODEL :
      if ( ! load_model ( ( state.cad_idx + 1 )
                          % collab.p_mesh_store->catalog_size() ) )
        return TICK_COLLABORATOR_FAILURE ;
      break ;
    case EV_DUMP_FRAME :
      if ( ! dump_frame() )
        return TICK_COLLABORATOR_FAILURE ;
      break ;
    case EV_NO_OP :
      break ;
    default :
      return TICK_UNSUPPORTED_EVENT ;
  }
  return TICK_OK ;
}

bool session_t::start()
{
  if (    collab.p_renderer == nullptr
       || collab.p_mesh_store == nullptr
       || collab.p_dataset == nullptr
       || collab.p_visibility == nullptr
       || collab.p_model == nullptr
       || collab.p_sink == nullptr )
  {
    std::cerr << "session: collaborator missing" << std::endl ;
    return false ;
  }

  if ( args.verbose )
    std::cout << "starting session for class " << object_class_name [ cls ]
              << ", frame size " << size << std::endl ;

  return load_model ( 0 ) && next_example() && render_pass() ;
}

tick_status_t session_t::tick ( event_t event )
{
  const char * name =   ( event >= 0 && event < EV_NONE )
                      ? event_name [ event ] : event_name [ EV_NONE ] ;

  if ( args.verbose )
    std::cout << "event: " << name << std::endl ;

  tick_status_t status = apply_event ( event ) ;

  if ( status == TICK_OK && ! render_pass() )
    status = TICK_COLLABORATOR_FAILURE ;

  if ( status != TICK_OK )
    std::cerr << "event " << name << ": "
              << tick_status_name [ status ] << std::endl ;

  return status ;
}

bool session_t::render_pass()
{
  if ( ! state.example )
  {
    std::cerr << "render pass: no dataset example loaded" << std::endl ;
    return false ;
  }

  state.machine = ST_AWAITING_RENDER ;
  geometry_warnings = 0 ;

  texture_example_t & ex ( *state.example ) ;

  viewpoint_t vp = viewpoint() ;
  camera_pose_t cam = to_camera_pose ( vp , size , size ) ;

  if ( args.verbose )
    std::cout << "Azimuth: " << vp.azimuth
              << " Elevation: " << clamp_pitch ( state.controls.pitch )
              << " Radius: " << vp.radius << std::endl ;

  bool success = false ;

  // the steps run in sequence, the first failure ends the pass

  do
  {
    collab.p_renderer->set_scene ( state.scene ) ;
    if ( ! collab.p_renderer->render ( cam , sketch ) )
    {
      std::cerr << "render pass: renderer failed" << std::endl ;
      break ;
    }

    geometry_warnings += project_keypoints ( state.kp3 , cam , kp2 ) ;

    resolve_planes ( cls , state.cad_idx , vp , kp2 ,
                     *collab.p_visibility , target_layout ) ;

    int degenerate = p_dispatch->warp_unwarp_planes
      ( ex.planes , ex.layout , target_layout , warped , unwarped ) ;

    if ( degenerate < 0 )
    {
      std::cerr << "render pass: warp engine failed" << std::endl ;
      break ;
    }
    geometry_warnings += degenerate ;

    if ( ! assemble_input ( cls , sketch , ex.central , warped ,
                            colour_mode , input ) )
      break ;

    if ( ! collab.p_model->synthesize ( input , synth ) )
    {
      std::cerr << "render pass: synthesis model failed" << std::endl ;
      break ;
    }

    decode_output ( synth , colour_mode ) ;

    if ( ! p_dispatch->composite ( synth , sketch , ex.central ,
                                   ex.src_image , frame ) )
      break ;

    success = true ;
  }
  while ( false ) ;

  state.machine = ST_IDLE ;

  if ( geometry_warnings && args.verbose )
    std::cout << "render pass: " << geometry_warnings
              << " geometry warning(s)" << std::endl ;

  if ( ! success )
    return false ;

  // the frame only becomes current once the sink has taken it

  if ( ! collab.p_sink->show ( frame ) )
  {
    std::cerr << "render pass: frame sink failed" << std::endl ;
    return false ;
  }

  state.last_frame.copy_data ( frame ) ;
  state.has_frame = true ;

  return true ;
}

} ; // namespace viewsynth
