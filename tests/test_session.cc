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

// tests for the session state machine, with in-memory collaborators

#include <set>
#include <string>

#include <gtest/gtest.h>

#include "session.h"

using namespace viewsynth ;

namespace
{

const std::size_t frame_size = 32 ;

// a small square mesh in the x/z plane, facing the default camera,
// and a chair-like box of keypoints around the origin

struct fake_mesh_store_t
: public mesh_store_t
{
  std::vector < int > requests ;
  std::set < int > broken ;

  int catalog_size() const
  {
    return viewsynth::catalog_size ;
  }

  bool load ( int idx , mesh_t & mesh , kpoint3_map_t & kp3 )
  {
    requests.push_back ( idx ) ;
    if ( broken.count ( idx ) )
      return false ;

    float s = 0.03f + 0.001f * idx ;
    mesh.clear() ;
    mesh.vertices = { Imath::V3f ( -s , 0.0f , -s ) ,
                      Imath::V3f ( s , 0.0f , -s ) ,
                      Imath::V3f ( s , 0.0f , s ) ,
                      Imath::V3f ( -s , 0.0f , s ) } ;
    mesh.triangles = { Imath::V3i ( 0 , 1 , 2 ) ,
                       Imath::V3i ( 0 , 2 , 3 ) } ;
    compute_vertex_normals ( mesh ) ;

    kp3.clear() ;
    kp3 [ "back_upper_left" ] = Imath::V3d ( -0.04 , 0.02 , 0.06 ) ;
    kp3 [ "back_upper_right" ] = Imath::V3d ( 0.04 , 0.02 , 0.06 ) ;
    kp3 [ "seat_upper_left" ] = Imath::V3d ( -0.04 , 0.02 , 0.0 ) ;
    kp3 [ "seat_upper_right" ] = Imath::V3d ( 0.04 , 0.02 , 0.0 ) ;
    kp3 [ "seat_lower_left" ] = Imath::V3d ( -0.04 , -0.04 , 0.0 ) ;
    kp3 [ "seat_lower_right" ] = Imath::V3d ( 0.04 , -0.04 , 0.0 ) ;
    kp3 [ "leg_upper_left" ] = Imath::V3d ( -0.04 , 0.02 , -0.06 ) ;
    kp3 [ "leg_upper_right" ] = Imath::V3d ( 0.04 , 0.02 , -0.06 ) ;
    kp3 [ "leg_lower_left" ] = Imath::V3d ( -0.04 , -0.04 , -0.06 ) ;
    kp3 [ "leg_lower_right" ] = Imath::V3d ( 0.04 , -0.04 , -0.06 ) ;
    return true ;
  }
} ;

struct fake_dataset_t
: public texture_source_t
{
  std::size_t n_examples ;
  std::vector < std::size_t > requests ;
  bool broken = false ;

  fake_dataset_t ( std::size_t _n_examples )
  : n_examples ( _n_examples )
  { }

  std::size_t size() const
  {
    return n_examples ;
  }

  bool load ( std::size_t index , example_ptr_t & example )
  {
    requests.push_back ( index ) ;
    if ( broken || index >= n_examples )
      return false ;

    std::size_t n = plane_count ( CLS_CHAIR ) ;
    example_ptr_t p_ex ( new texture_example_t ( frame_size , frame_size , n ) ) ;
    p_ex->name = "example " + std::to_string ( index ) ;

    float v = 0.1f * ( index + 1 ) ;
    p_ex->src_image.set_data ( px_t { v , 0.5f , 0.5f } ) ;
    p_ex->central.set_data ( px_t { 0.5f , v , 0.5f } ) ;
    p_ex->planes.set_data ( px_t { 0.5f , 0.5f , v } ) ;

    for ( std::size_t i = 0 ; i < n ; i++ )
    {
      p_ex->layout.kpoints [ i ] = { { -1.0f , -1.0f } , { 1.0f , -1.0f } ,
                                     { 1.0f , 1.0f } , { -1.0f , 1.0f } } ;
      p_ex->layout.visible [ i ] = true ;
    }

    example = p_ex ;
    return true ;
  }
} ;

struct fake_sink_t
: public frame_sink_t
{
  int shown = 0 ;
  std::vector < std::string > persisted ;
  bool broken = false ;
  bool show_broken = false ;

  bool show ( image_view_t frame )
  {
    if ( show_broken )
      return false ;
    ++shown ;
    return true ;
  }

  bool persist ( image_view_t frame , const std::string & stem )
  {
    if ( broken )
      return false ;
    persisted.push_back ( stem ) ;
    return true ;
  }
} ;

// the software renderer, which can be told to fail

struct flaky_renderer_t
: public normal_renderer_t
{
  bool broken = false ;

  bool render ( const camera_pose_t & pose , image_t & image )
  {
    if ( broken )
      return false ;
    return normal_renderer_t::render ( pose , image ) ;
  }
} ;

bool same_pixels ( image_t & a , image_t & b )
{
  if ( a.shape != b.shape )
    return false ;
  for ( long y = 0 ; y < long ( a.shape[1] ) ; y++ )
  {
    for ( long x = 0 ; x < long ( a.shape[0] ) ; x++ )
    {
      for ( int c = 0 ; c < 3 ; c++ )
      {
        if ( a [ { x , y } ] [ c ] != b [ { x , y } ] [ c ] )
          return false ;
      }
    }
  }
  return true ;
}

struct session_test
: public ::testing::Test
{
  flaky_renderer_t renderer ;
  fake_mesh_store_t mesh_store ;
  fake_dataset_t dataset ;
  winding_visibility_t visibility ;
  composite_model_t model ;
  fake_sink_t sink ;
  collaborators_t collab ;

  session_test()
  : dataset ( 3 ) ,
    model ( CLS_CHAIR , CS_LAB )
  {
    collab.p_renderer = &renderer ;
    collab.p_mesh_store = &mesh_store ;
    collab.p_dataset = &dataset ;
    collab.p_visibility = &visibility ;
    collab.p_model = &model ;
    collab.p_sink = &sink ;
  }
} ;

} ; // anonymous namespace

TEST_F ( session_test , fresh_session_looks_at_the_side )
{
  session_t session ( CLS_CHAIR , frame_size , 1000.0 , collab ) ;
  ASSERT_TRUE ( session.start() ) ;

  EXPECT_EQ ( sink.shown , 1 ) ;
  EXPECT_TRUE ( session.state.has_frame ) ;
  EXPECT_EQ ( session.state.machine , ST_IDLE ) ;
  EXPECT_EQ ( session.state.cad_idx , 0 ) ;
  EXPECT_EQ ( mesh_store.requests , std::vector < int > { 0 } ) ;
  EXPECT_EQ ( dataset.requests , std::vector < std::size_t > { 0 } ) ;
  EXPECT_EQ ( session.state.last_frame.shape[0] , 4 * frame_size ) ;
  EXPECT_EQ ( session.state.last_frame.shape[1] , frame_size ) ;

  viewpoint_t vp = session.viewpoint() ;
  EXPECT_DOUBLE_EQ ( vp.azimuth , 90.0 ) ;
  EXPECT_DOUBLE_EQ ( vp.elevation , 0.0 ) ;
  EXPECT_DOUBLE_EQ ( vp.radius , 7.0 ) ;

  camera_pose_t pose = session.pose() ;
  EXPECT_NEAR ( pose.center().y , -7.0 , 1e-9 ) ;
  EXPECT_NEAR ( pose.forward().y , 1.0 , 1e-9 ) ;

  // the masked synthesis is white outside the object

  px_t corner = session.state.last_frame [ { long ( 2 * frame_size ) , 0L } ] ;
  EXPECT_FLOAT_EQ ( corner[0] , 1.0f ) ;
  EXPECT_FLOAT_EQ ( corner[2] , 1.0f ) ;
}

TEST_F ( session_test , eighteen_steps_right_turn_the_azimuth )
{
  session_t session ( CLS_CHAIR , frame_size , 1000.0 , collab ) ;
  ASSERT_TRUE ( session.start() ) ;

  for ( int i = 0 ; i < 18 ; i++ )
    EXPECT_EQ ( session.tick ( EV_ROTATE_RIGHT ) , TICK_OK ) ;

  EXPECT_DOUBLE_EQ ( session.state.controls.yaw , 90.0 ) ;
  EXPECT_DOUBLE_EQ ( session.viewpoint().azimuth , 180.0 ) ;
  EXPECT_EQ ( sink.shown , 19 ) ;

  for ( int i = 0 ; i < 36 ; i++ )
    session.tick ( EV_ROTATE_LEFT ) ;

  EXPECT_DOUBLE_EQ ( session.viewpoint().azimuth , 0.0 ) ;
}

TEST_F ( session_test , next_model_wraps_after_ten )
{
  session_t session ( CLS_CHAIR , frame_size , 1000.0 , collab ) ;
  ASSERT_TRUE ( session.start() ) ;

  for ( int i = 0 ; i < 10 ; i++ )
    EXPECT_EQ ( session.tick ( EV_NEXT_MODEL ) , TICK_OK ) ;

  EXPECT_EQ ( session.state.cad_idx , 0 ) ;
  EXPECT_EQ ( mesh_store.requests ,
              ( std::vector < int > { 0 , 1 , 2 , 3 , 4 , 5 , 6 , 7 , 8 , 9 , 0 } ) ) ;
}

TEST_F ( session_test , dumps_are_numbered_sequentially )
{
  session_t session ( CLS_CHAIR , frame_size , 1000.0 , collab ) ;
  ASSERT_TRUE ( session.start() ) ;

  view_controls_t before = session.state.controls ;

  EXPECT_EQ ( session.tick ( EV_DUMP_FRAME ) , TICK_OK ) ;
  EXPECT_EQ ( session.tick ( EV_DUMP_FRAME ) , TICK_OK ) ;

  ASSERT_EQ ( sink.persisted.size() , 2u ) ;
  EXPECT_EQ ( sink.persisted[0] , "000_el_000_az_090_rad_007" ) ;
  EXPECT_EQ ( sink.persisted[1] , "001_el_000_az_090_rad_007" ) ;
  EXPECT_EQ ( session.state.dump_id , 2 ) ;

  EXPECT_EQ ( session.state.controls.yaw , before.yaw ) ;
  EXPECT_EQ ( session.state.controls.pitch , before.pitch ) ;
  EXPECT_EQ ( session.state.controls.radius , before.radius ) ;

  // a failed dump doesn't advance the counter

  sink.broken = true ;
  EXPECT_EQ ( session.tick ( EV_DUMP_FRAME ) , TICK_COLLABORATOR_FAILURE ) ;
  EXPECT_EQ ( session.state.dump_id , 2 ) ;
}

TEST_F ( session_test , dump_name_follows_the_controls )
{
  session_t session ( CLS_CHAIR , frame_size , 1000.0 , collab ) ;
  ASSERT_TRUE ( session.start() ) ;

  session.tick ( EV_ROTATE_DOWN ) ;
  session.tick ( EV_ROTATE_DOWN ) ;
  session.tick ( EV_ROTATE_LEFT ) ;
  for ( int i = 0 ; i < 10 ; i++ )
    session.tick ( EV_ZOOM_OUT ) ;

  // the radius is truncated: 7.5 yields 7

  EXPECT_EQ ( session.current_dump_name() , "000_el_010_az_085_rad_007" ) ;

  for ( int i = 0 ; i < 20 ; i++ )
    session.tick ( EV_ZOOM_OUT ) ;
  EXPECT_EQ ( session.current_dump_name() , "000_el_010_az_085_rad_008" ) ;
}

TEST_F ( session_test , no_op_is_idempotent )
{
  session_t session ( CLS_CHAIR , frame_size , 1000.0 , collab ) ;
  ASSERT_TRUE ( session.start() ) ;

  image_t first ( session.state.last_frame.shape ) ;
  first.copy_data ( session.state.last_frame ) ;

  EXPECT_EQ ( session.tick ( EV_NO_OP ) , TICK_OK ) ;
  EXPECT_EQ ( session.tick ( EV_NO_OP ) , TICK_OK ) ;

  EXPECT_TRUE ( same_pixels ( first , session.state.last_frame ) ) ;
  EXPECT_EQ ( session.state.cad_idx , 0 ) ;
  EXPECT_EQ ( session.state.dataset_index , 1u ) ;
  EXPECT_EQ ( sink.shown , 3 ) ;
}

TEST_F ( session_test , controls_stay_in_bounds )
{
  session_t session ( CLS_CHAIR , frame_size , 1000.0 , collab ) ;
  ASSERT_TRUE ( session.start() ) ;

  for ( int i = 0 ; i < 5 ; i++ )
    session.tick ( EV_ROTATE_UP ) ;
  EXPECT_DOUBLE_EQ ( session.state.controls.pitch , 90.0 ) ;

  for ( int i = 0 ; i < 40 ; i++ )
    session.tick ( EV_ROTATE_DOWN ) ;
  EXPECT_DOUBLE_EQ ( session.state.controls.pitch , -90.0 ) ;
  EXPECT_DOUBLE_EQ ( session.viewpoint().elevation , 180.0 ) ;

  for ( int i = 0 ; i < 150 ; i++ )
    session.apply_event ( EV_ZOOM_IN ) ;
  EXPECT_DOUBLE_EQ ( session.state.controls.radius , min_radius ) ;

  for ( int i = 0 ; i < 400 ; i++ )
    session.apply_event ( EV_ZOOM_OUT ) ;
  EXPECT_DOUBLE_EQ ( session.state.controls.radius , max_radius ) ;

  // the pipeline copes with the extreme viewpoint

  EXPECT_EQ ( session.tick ( EV_NO_OP ) , TICK_OK ) ;
}

TEST_F ( session_test , next_example_cycles_through_the_dataset )
{
  session_t session ( CLS_CHAIR , frame_size , 1000.0 , collab ) ;
  ASSERT_TRUE ( session.start() ) ;

  EXPECT_EQ ( session.state.example->name , "example 0" ) ;

  session.tick ( EV_NEXT_EXAMPLE ) ;
  EXPECT_EQ ( session.state.example->name , "example 1" ) ;
  session.tick ( EV_NEXT_EXAMPLE ) ;
  session.tick ( EV_NEXT_EXAMPLE ) ;
  EXPECT_EQ ( session.state.example->name , "example 0" ) ;
  EXPECT_EQ ( session.state.dataset_index , 1u ) ;
}

TEST_F ( session_test , unsupported_events_change_nothing )
{
  session_t session ( CLS_CHAIR , frame_size , 1000.0 , collab ) ;
  ASSERT_TRUE ( session.start() ) ;

  session.tick ( EV_ROTATE_RIGHT ) ;

  image_t before ( session.state.last_frame.shape ) ;
  before.copy_data ( session.state.last_frame ) ;
  view_controls_t controls = session.state.controls ;
  int shown = sink.shown ;

  EXPECT_EQ ( session.tick ( EV_NONE ) , TICK_UNSUPPORTED_EVENT ) ;
  EXPECT_EQ ( session.tick ( key_to_event ( 'q' ) ) , TICK_UNSUPPORTED_EVENT ) ;

  EXPECT_EQ ( sink.shown , shown ) ;
  EXPECT_EQ ( session.state.controls.yaw , controls.yaw ) ;
  EXPECT_EQ ( session.state.controls.pitch , controls.pitch ) ;
  EXPECT_EQ ( session.state.controls.radius , controls.radius ) ;
  EXPECT_TRUE ( same_pixels ( before , session.state.last_frame ) ) ;
  EXPECT_EQ ( session.state.machine , ST_IDLE ) ;
}

TEST_F ( session_test , collaborator_failure_keeps_the_frame )
{
  session_t session ( CLS_CHAIR , frame_size , 1000.0 , collab ) ;
  ASSERT_TRUE ( session.start() ) ;

  image_t before ( session.state.last_frame.shape ) ;
  before.copy_data ( session.state.last_frame ) ;
  int shown = sink.shown ;

  renderer.broken = true ;
  EXPECT_EQ ( session.tick ( EV_ROTATE_RIGHT ) , TICK_COLLABORATOR_FAILURE ) ;
  EXPECT_EQ ( sink.shown , shown ) ;
  EXPECT_TRUE ( same_pixels ( before , session.state.last_frame ) ) ;
  EXPECT_EQ ( session.state.machine , ST_IDLE ) ;

  // a model which can't be loaded leaves the current one in place

  renderer.broken = false ;
  mesh_store.broken.insert ( 1 ) ;
  EXPECT_EQ ( session.tick ( EV_NEXT_MODEL ) , TICK_COLLABORATOR_FAILURE ) ;
  EXPECT_EQ ( session.state.cad_idx , 0 ) ;
  EXPECT_FALSE ( session.state.kp3.empty() ) ;

  // same for the dataset

  dataset.broken = true ;
  EXPECT_EQ ( session.tick ( EV_NEXT_EXAMPLE ) , TICK_COLLABORATOR_FAILURE ) ;
  EXPECT_EQ ( session.state.example->name , "example 0" ) ;
  EXPECT_EQ ( session.state.dataset_index , 1u ) ;

  // the session carries on

  EXPECT_EQ ( session.tick ( EV_NO_OP ) , TICK_OK ) ;
}

TEST_F ( session_test , frame_refused_by_the_sink_is_not_current )
{
  session_t session ( CLS_CHAIR , frame_size , 1000.0 , collab ) ;
  ASSERT_TRUE ( session.start() ) ;

  image_t before ( session.state.last_frame.shape ) ;
  before.copy_data ( session.state.last_frame ) ;

  // switching the example changes the frame content

  sink.show_broken = true ;
  EXPECT_EQ ( session.tick ( EV_NEXT_EXAMPLE ) , TICK_COLLABORATOR_FAILURE ) ;
  EXPECT_TRUE ( same_pixels ( before , session.state.last_frame ) ) ;
  EXPECT_EQ ( session.state.machine , ST_IDLE ) ;

  // a dump now stores the frame which was last shown

  EXPECT_EQ ( session.tick ( EV_DUMP_FRAME ) , TICK_COLLABORATOR_FAILURE ) ;
  ASSERT_EQ ( sink.persisted.size() , 1u ) ;
  EXPECT_TRUE ( same_pixels ( before , session.state.last_frame ) ) ;

  sink.show_broken = false ;
  EXPECT_EQ ( session.tick ( EV_NO_OP ) , TICK_OK ) ;
  EXPECT_FALSE ( same_pixels ( before , session.state.last_frame ) ) ;
}

TEST_F ( session_test , verbose_viewpoint_line_shows_the_pitch )
{
  session_t session ( CLS_CHAIR , frame_size , 1000.0 , collab ) ;
  ASSERT_TRUE ( session.start() ) ;

  session.tick ( EV_ROTATE_DOWN ) ;

  bool verbose = args.verbose ;
  args.verbose = true ;
  testing::internal::CaptureStdout() ;
  session.tick ( EV_ROTATE_DOWN ) ;
  std::string out = testing::internal::GetCapturedStdout() ;
  args.verbose = verbose ;

  EXPECT_NE ( out.find ( "Azimuth: 90 Elevation: -10 Radius: 7" ) ,
              std::string::npos ) << out ;
}

TEST_F ( session_test , start_needs_all_collaborators )
{
  collaborators_t partial = collab ;
  partial.p_model = nullptr ;

  session_t broken ( CLS_CHAIR , frame_size , 1000.0 , partial ) ;
  EXPECT_FALSE ( broken.start() ) ;

  dataset.broken = true ;
  session_t no_data ( CLS_CHAIR , frame_size , 1000.0 , collab ) ;
  EXPECT_FALSE ( no_data.start() ) ;
  EXPECT_FALSE ( no_data.state.has_frame ) ;
}
