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

// This header has the viewpoint model and the keypoint projector.
// The operator steers the camera with three 'controls': yaw, pitch and
// radius. From these we derive a viewpoint in the PASCAL3D+ convention
// (azimuth, elevation, distance), and from the viewpoint a pinhole
// camera pose which we use both to project the object's semantic
// keypoints and to drive the renderer.
// The bridging between the controls and the viewpoint convention is
// done by a set of small named functions, so that the offsets and
// sign conventions are all in one place and can be tested.

#ifndef VIEWSYNTH_CAMERA_H
#define VIEWSYNTH_CAMERA_H

#include <map>
#include <string>

#include <Imath/ImathVec.h>
#include <Imath/ImathMatrix.h>

#include "common.h"

namespace viewsynth
{

// the step sizes for the discrete control events. angles in degrees.

const double angle_step = 5.0 ;
const double radius_step = 0.05 ;

// the explicit bounds for the radius control.

const double min_radius = 1.0 ;
const double max_radius = 20.0 ;

// the controls the operator manipulates. The defaults produce a view
// onto the object's side from the horizon, at distance 7.

struct view_controls_t
{
  double yaw = 0.0 ;
  double pitch = 90.0 ;
  double radius = 7.0 ;
  double focal = 1000.0 ;
} ;

// the viewpoint derived from the controls. 'azimuth' is in [0,360),
// 'elevation' is the angle above the horizontal plane, in [0,180].

struct viewpoint_t
{
  double azimuth ;
  double elevation ;
  double radius ;
  double focal ;
} ;

double clamp_pitch ( double pitch ) ;

double clamp_radius ( double radius ) ;

// az = ( yaw + 90 ) mod 360, always non-negative

double control_to_azimuth ( double yaw ) ;

// el = 90 - pitch, with pitch clamped to [-90,90] first

double control_to_elevation ( double pitch ) ;

viewpoint_t to_viewpoint ( const view_controls_t & controls ) ;

// intrinsic parameters of a pinhole camera. The principal point is
// in pixel units, where pixel ( i , j ) covers [i,i+1) x [j,j+1).

struct intrinsic_t
{
  double focal ;
  double cx ;
  double cy ;
  int width ;
  int height ;
} ;

// the extrinsic transformation takes a point in world coordinates to
// camera coordinates: p_cam = rotation * p_world + translation. We use
// lux convention for the camera coordinates: x is to the right, y down
// and z forward.

struct extrinsic_t
{
  Imath::M33d rotation ;
  Imath::V3d translation ;
} ;

struct camera_pose_t
{
  intrinsic_t intrinsic ;
  extrinsic_t extrinsic ;

  Imath::V3d to_camera ( const Imath::V3d & p ) const ;

  // the camera's position in world coordinates

  Imath::V3d center() const ;

  // the direction of the camera's optical axis in world coordinates

  Imath::V3d forward() const ;
} ;

// build a camera pose for a viewpoint and a given frame size. The
// camera is placed on a sphere around the origin and looks at it.

camera_pose_t to_camera_pose ( const viewpoint_t & viewpoint ,
                               int width ,
                               int height ) ;

// 3D keypoints are loaded per CAD model, 2D keypoints are produced
// per frame. Both are keyed by the keypoint's semantic name.

typedef std::map < std::string , Imath::V3d > kpoint3_map_t ;
typedef std::map < std::string , v2_t > kpoint2_map_t ;

// the smallest depth we accept for a projected point. Points closer
// to the camera plane - or behind it - are clamped to this depth.

const double min_depth = 1e-6 ;

// project the 3D keypoints into normalized image coordinates in
// [-1,1]^2. The output has exactly one entry per input point: points
// outside the frame are clamped to the frame's margin, and points
// behind the camera get their depth clamped to min_depth. The return
// value is the number of points which had to be depth-clamped.

int project_keypoints ( const kpoint3_map_t & kp3 ,
                        const camera_pose_t & pose ,
                        kpoint2_map_t & kp2 ) ;

// map normalized image coordinates to pixel coordinates as used by
// zimt's b-splines, where the center of pixel i is at i.

double normalized_to_pixel ( double n , int extent ) ;

} ; // namespace viewsynth

#endif // VIEWSYNTH_CAMERA_H
