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

// implementation of the viewpoint model and the keypoint projector.
// This is scalar code - per frame, we handle one pose and a few dozen
// keypoints, so there's no point in vectorizing it.

#include <algorithm>

#include "camera.h"

namespace viewsynth
{

double clamp_pitch ( double pitch )
{
  return std::max ( -90.0 , std::min ( 90.0 , pitch ) ) ;
}

double clamp_radius ( double radius )
{
  return std::max ( min_radius , std::min ( max_radius , radius ) ) ;
}

double control_to_azimuth ( double yaw )
{
  double az = std::fmod ( yaw + 90.0 , 360.0 ) ;
  if ( az < 0.0 )
    az += 360.0 ;
  return az ;
}

double control_to_elevation ( double pitch )
{
  return 90.0 - clamp_pitch ( pitch ) ;
}

viewpoint_t to_viewpoint ( const view_controls_t & controls )
{
  viewpoint_t vp ;
  vp.azimuth = control_to_azimuth ( controls.yaw ) ;
  vp.elevation = control_to_elevation ( controls.pitch ) ;
  vp.radius = clamp_radius ( controls.radius ) ;
  vp.focal = controls.focal ;
  return vp ;
}

Imath::V3d camera_pose_t::to_camera ( const Imath::V3d & p ) const
{
  const Imath::M33d & r ( extrinsic.rotation ) ;
  return Imath::V3d ( r[0][0] * p.x + r[0][1] * p.y + r[0][2] * p.z ,
                      r[1][0] * p.x + r[1][1] * p.y + r[1][2] * p.z ,
                      r[2][0] * p.x + r[2][1] * p.y + r[2][2] * p.z )
         + extrinsic.translation ;
}

// with p_cam = R p + t, the camera center is at -R^T t

Imath::V3d camera_pose_t::center() const
{
  const Imath::M33d & r ( extrinsic.rotation ) ;
  const Imath::V3d & t ( extrinsic.translation ) ;
  return - Imath::V3d ( r[0][0] * t.x + r[1][0] * t.y + r[2][0] * t.z ,
                        r[0][1] * t.x + r[1][1] * t.y + r[2][1] * t.z ,
                        r[0][2] * t.x + r[1][2] * t.y + r[2][2] * t.z ) ;
}

// the third row of the rotation is the camera's z axis

Imath::V3d camera_pose_t::forward() const
{
  const Imath::M33d & r ( extrinsic.rotation ) ;
  return Imath::V3d ( r[2][0] , r[2][1] , r[2][2] ) ;
}

// The camera looks at the origin from azimuth a and elevation e. For
// e = 0 and a = 90 degrees, it's on the negative y axis looking along
// +y, and for e = 90 it looks straight down. The camera's 'right'
// axis is always horizontal, so the frame never degenerates, even
// when looking straight up or down.

camera_pose_t to_camera_pose ( const viewpoint_t & viewpoint ,
                               int width ,
                               int height )
{
  double a = viewpoint.azimuth * M_PI / 180.0 ;
  double e = viewpoint.elevation * M_PI / 180.0 ;
  double r = viewpoint.radius ;

  double sa = sin ( a ) , ca = cos ( a ) ;
  double se = sin ( e ) , ce = cos ( e ) ;

  Imath::V3d right ( sa , - ca , 0.0 ) ;
  Imath::V3d down ( - se * ca , - se * sa , - ce ) ;
  Imath::V3d forward ( ce * ca , ce * sa , - se ) ;

  Imath::V3d center = - r * forward ;

  camera_pose_t pose ;

  pose.intrinsic.focal = viewpoint.focal ;
  pose.intrinsic.cx = width / 2.0 ;
  pose.intrinsic.cy = height / 2.0 ;
  pose.intrinsic.width = width ;
  pose.intrinsic.height = height ;

  pose.extrinsic.rotation = Imath::M33d ( right.x , right.y , right.z ,
                                          down.x , down.y , down.z ,
                                          forward.x , forward.y , forward.z ) ;

  // t = - R * center. since the camera looks at the origin, this is
  // simply ( 0 , 0 , r ), but we spell it out.

  pose.extrinsic.translation = Imath::V3d ( - right.dot ( center ) ,
                                            - down.dot ( center ) ,
                                            - forward.dot ( center ) ) ;
  return pose ;
}

int project_keypoints ( const kpoint3_map_t & kp3 ,
                        const camera_pose_t & pose ,
                        kpoint2_map_t & kp2 )
{
  int clamped = 0 ;
  const intrinsic_t & in ( pose.intrinsic ) ;
  double half_w = in.width / 2.0 ;
  double half_h = in.height / 2.0 ;

  kp2.clear() ;

  for ( const auto & kp : kp3 )
  {
    Imath::V3d pc = pose.to_camera ( kp.second ) ;

    if ( pc.z <= min_depth )
    {
      pc.z = min_depth ;
      ++clamped ;
    }

    double u = in.focal * pc.x / pc.z + in.cx ;
    double v = in.focal * pc.y / pc.z + in.cy ;

    double nx = std::max ( -1.0 , std::min ( 1.0 , ( u - in.cx ) / half_w ) ) ;
    double ny = std::max ( -1.0 , std::min ( 1.0 , ( v - in.cy ) / half_h ) ) ;

    kp2 [ kp.first ] = v2_t { float ( nx ) , float ( ny ) } ;
  }

  if ( clamped && args.verbose )
    std::cout << "keypoint projection: " << clamped
              << " point(s) at or behind the camera plane were clamped"
              << std::endl ;

  return clamped ;
}

double normalized_to_pixel ( double n , int extent )
{
  return ( n + 1.0 ) * extent / 2.0 - 0.5 ;
}

} ; // namespace viewsynth
