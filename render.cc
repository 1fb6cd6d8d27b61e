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

// implementation of the normal renderer. This is a plain scanline-free
// rasterizer: for each triangle, we visit the pixels in it's bounding
// box and test the pixel centers against the triangle's edges.

#include <algorithm>
#include <limits>

#include "render.h"

namespace viewsynth
{

void compute_vertex_normals ( mesh_t & mesh )
{
  std::size_t nv = mesh.vertices.size() ;

  mesh.normals.assign ( nv , Imath::V3f ( 0.0f , 0.0f , 0.0f ) ) ;
  mesh.colours.assign ( nv , Imath::V3f ( 0.0f , 0.0f , 0.0f ) ) ;

  // the cross product's length is twice the triangle's area, so summing
  // up the unnormalized face normals weights them by area.

  for ( const auto & tri : mesh.triangles )
  {
    const Imath::V3f & a ( mesh.vertices [ tri.x ] ) ;
    const Imath::V3f & b ( mesh.vertices [ tri.y ] ) ;
    const Imath::V3f & c ( mesh.vertices [ tri.z ] ) ;

    Imath::V3f n = ( b - a ) .cross ( c - a ) ;

    mesh.normals [ tri.x ] += n ;
    mesh.normals [ tri.y ] += n ;
    mesh.normals [ tri.z ] += n ;
  }

  for ( std::size_t i = 0 ; i < nv ; i++ )
  {
    Imath::V3f & n ( mesh.normals [ i ] ) ;

    // vertices which aren't part of any proper triangle get a
    // normal pointing along +z

    if ( n.length() > 0.0f )
      n.normalize() ;
    else
      n = Imath::V3f ( 0.0f , 0.0f , 1.0f ) ;

    mesh.colours [ i ] = ( n + Imath::V3f ( 1.0f , 1.0f , 1.0f ) ) / 2.0f ;
  }
}

std::vector < primitive_t > scene_t::primitives() const
{
  std::vector < primitive_t > result ;

  if ( mesh.triangles.size() )
  {
    primitive_t p ;
    p.kind = PRIM_MESH ;
    p.p_mesh = &mesh ;
    result.push_back ( p ) ;
  }

  for ( const auto & line : lines )
  {
    primitive_t p ;
    p.kind = PRIM_LINE ;
    p.p_line = &line ;
    result.push_back ( p ) ;
  }

  for ( const auto & point : points )
  {
    primitive_t p ;
    p.kind = PRIM_POINT ;
    p.p_point = &point ;
    result.push_back ( p ) ;
  }

  return result ;
}

void normal_renderer_t::set_scene ( const scene_t & scene )
{
  p_scene = &scene ;
}

namespace
{

// a vertex after projection: pixel coordinates (pixel i covers
// [i,i+1)), depth and colour

struct screen_vertex_t
{
  double u , v , z ;
  Imath::V3f colour ;
} ;

// the render target with it's z-buffer

struct frame_buffer_t
{
  image_t & image ;
  std::vector < double > depth ;
  long width , height ;

  frame_buffer_t ( image_t & _image )
  : image ( _image ) ,
    width ( _image.shape[0] ) ,
    height ( _image.shape[1] )
  {
    depth.assign ( width * height , std::numeric_limits<double>::max() ) ;
    px_t black ;
    black = 0.0f ;
    image.set_data ( black ) ;
  }

  void plot ( long x , long y , double z , const Imath::V3f & c )
  {
    if ( x < 0 || x >= width || y < 0 || y >= height )
      return ;

    double & d ( depth [ y * width + x ] ) ;
    if ( z < d )
    {
      d = z ;
      image [ { x , y } ] = px_t { c.x , c.y , c.z } ;
    }
  }
} ;

bool project_vertex ( const camera_pose_t & pose ,
                      const Imath::V3f & p ,
                      const Imath::V3f & colour ,
                      double near_plane ,
                      screen_vertex_t & sv )
{
  Imath::V3d pc = pose.to_camera ( Imath::V3d ( p.x , p.y , p.z ) ) ;
  if ( pc.z <= near_plane )
    return false ;

  sv.u = pose.intrinsic.focal * pc.x / pc.z + pose.intrinsic.cx ;
  sv.v = pose.intrinsic.focal * pc.y / pc.z + pose.intrinsic.cy ;
  sv.z = pc.z ;
  sv.colour = colour ;
  return true ;
}

// edge function: twice the signed area of the triangle ( a , b , p )

double edge ( const screen_vertex_t & a , const screen_vertex_t & b ,
              double px , double py )
{
  return ( b.u - a.u ) * ( py - a.v ) - ( b.v - a.v ) * ( px - a.u ) ;
}

void draw_triangle ( frame_buffer_t & fb ,
                     const screen_vertex_t & a ,
                     const screen_vertex_t & b ,
                     const screen_vertex_t & c )
{
  double area = edge ( a , b , c.u , c.v ) ;
  if ( std::abs ( area ) < 1e-12 )
    return ;

  long x0 = std::max ( 0L , long ( std::floor ( std::min ( { a.u , b.u , c.u } ) ) ) ) ;
  long x1 = std::min ( fb.width - 1 , long ( std::ceil ( std::max ( { a.u , b.u , c.u } ) ) ) ) ;
  long y0 = std::max ( 0L , long ( std::floor ( std::min ( { a.v , b.v , c.v } ) ) ) ) ;
  long y1 = std::min ( fb.height - 1 , long ( std::ceil ( std::max ( { a.v , b.v , c.v } ) ) ) ) ;

  for ( long y = y0 ; y <= y1 ; y++ )
  {
    for ( long x = x0 ; x <= x1 ; x++ )
    {
      double px = x + 0.5 ;
      double py = y + 0.5 ;

      // barycentric weights. Dividing by the signed area makes them
      // positive inside the triangle, whatever it's winding - so we
      // draw both sides.

      double wa = edge ( b , c , px , py ) / area ;
      double wb = edge ( c , a , px , py ) / area ;
      double wc = edge ( a , b , px , py ) / area ;

      if ( wa < 0.0 || wb < 0.0 || wc < 0.0 )
        continue ;

      // perspective-correct interpolation: 1/z is linear in screen
      // space, and so are attributes divided by z.

      double iz = wa / a.z + wb / b.z + wc / c.z ;
      double z = 1.0 / iz ;

      Imath::V3f colour = (   a.colour * float ( wa / a.z )
                            + b.colour * float ( wb / b.z )
                            + c.colour * float ( wc / c.z ) ) * float ( z ) ;

      fb.plot ( x , y , z , colour ) ;
    }
  }
}

void draw_mesh ( frame_buffer_t & fb ,
                 const camera_pose_t & pose ,
                 const mesh_t & mesh ,
                 double near_plane )
{
  bool have_colours = ( mesh.colours.size() == mesh.vertices.size() ) ;
  Imath::V3f grey ( 0.5f , 0.5f , 0.5f ) ;
  int skipped = 0 ;

  for ( const auto & tri : mesh.triangles )
  {
    screen_vertex_t sv [ 3 ] ;
    bool in_front = true ;

    for ( int k = 0 ; k < 3 ; k++ )
    {
      int i = tri [ k ] ;
      in_front &= project_vertex ( pose , mesh.vertices [ i ] ,
                                   have_colours ? mesh.colours [ i ] : grey ,
                                   near_plane , sv [ k ] ) ;
    }

    if ( in_front )
      draw_triangle ( fb , sv[0] , sv[1] , sv[2] ) ;
    else
      ++skipped ;
  }

  if ( skipped && args.verbose )
    std::cout << "renderer: skipped " << skipped
              << " triangles crossing the near plane" << std::endl ;
}

void draw_line ( frame_buffer_t & fb ,
                 const camera_pose_t & pose ,
                 const line_t & line ,
                 double near_plane )
{
  screen_vertex_t a , b ;
  if (    ! project_vertex ( pose , line.from , line.colour , near_plane , a )
       || ! project_vertex ( pose , line.to , line.colour , near_plane , b ) )
    return ;

  double du = b.u - a.u ;
  double dv = b.v - a.v ;
  int steps = std::max ( 1 , int ( std::ceil ( std::max ( std::abs ( du ) ,
                                                          std::abs ( dv ) ) ) ) ) ;

  for ( int i = 0 ; i <= steps ; i++ )
  {
    double t = double ( i ) / steps ;
    double iz = ( 1.0 - t ) / a.z + t / b.z ;
    fb.plot ( long ( std::floor ( a.u + t * du ) ) ,
              long ( std::floor ( a.v + t * dv ) ) ,
              1.0 / iz , line.colour ) ;
  }
}

void draw_point ( frame_buffer_t & fb ,
                  const camera_pose_t & pose ,
                  const point_t & point ,
                  double near_plane )
{
  screen_vertex_t sv ;
  if ( ! project_vertex ( pose , point.position , point.colour ,
                          near_plane , sv ) )
    return ;

  long cx = long ( std::floor ( sv.u ) ) ;
  long cy = long ( std::floor ( sv.v ) ) ;
  long r = std::max ( 0 , point.size / 2 ) ;

  for ( long y = cy - r ; y <= cy + r ; y++ )
  {
    for ( long x = cx - r ; x <= cx + r ; x++ )
      fb.plot ( x , y , sv.z , point.colour ) ;
  }
}

} ; // anonymous namespace

bool normal_renderer_t::render ( const camera_pose_t & pose , image_t & image )
{
  if ( p_scene == nullptr )
  {
    std::cerr << "renderer: no scene set" << std::endl ;
    return false ;
  }

  if (    long ( image.shape[0] ) != pose.intrinsic.width
       || long ( image.shape[1] ) != pose.intrinsic.height )
  {
    std::cerr << "renderer: image is " << image.shape[0] << "x"
              << image.shape[1] << ", camera expects "
              << pose.intrinsic.width << "x" << pose.intrinsic.height
              << std::endl ;
    return false ;
  }

  frame_buffer_t fb ( image ) ;

  for ( const auto & prim : p_scene->primitives() )
  {
    switch ( prim.kind )
    {
      case PRIM_MESH :
        draw_mesh ( fb , pose , *prim.p_mesh , near_plane ) ;
        break ;
      case PRIM_LINE :
        draw_line ( fb , pose , *prim.p_line , near_plane ) ;
        break ;
      case PRIM_POINT :
        draw_point ( fb , pose , *prim.p_point , near_plane ) ;
        break ;
      default :
        std::cerr << "renderer: can't draw primitive of kind "
                  << primitive_kind_name [ prim.kind ] << std::endl ;
        return false ;
    }
  }
  return true ;
}

} ; // namespace viewsynth
