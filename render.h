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

// The renderer produces the 'sketch': an image of the current CAD mesh
// seen from the current camera pose, where every surface point is
// painted with a colour derived from it's normal. The background is
// pure black, which the compositor relies on to find the object's
// silhouette.
// The scene is a fixed-shape record holding the mesh and optional
// line and point primitives (e.g. to show the keypoints). The renderer
// iterates over the scene's primitives via the 'primitives' accessor,
// so it needs no knowledge of how the scene is composed.

#ifndef VIEWSYNTH_RENDER_H
#define VIEWSYNTH_RENDER_H

#include <vector>

#include <Imath/ImathVec.h>

#include "camera.h"

namespace viewsynth
{

// a triangle mesh. 'normals' and 'colours' hold one entry per vertex,
// they are filled in by compute_vertex_normals.

struct mesh_t
{
  std::vector < Imath::V3f > vertices ;
  std::vector < Imath::V3f > normals ;
  std::vector < Imath::V3f > colours ;
  std::vector < Imath::V3i > triangles ;

  void clear()
  {
    vertices.clear() ;
    normals.clear() ;
    colours.clear() ;
    triangles.clear() ;
  }
} ;

// calculate area-weighted vertex normals and set the vertex colours
// to ( n + 1 ) / 2 - the usual normal-map encoding.

void compute_vertex_normals ( mesh_t & mesh ) ;

struct line_t
{
  Imath::V3f from ;
  Imath::V3f to ;
  Imath::V3f colour ;
} ;

// points are drawn as small squares, 'size' pixels wide

struct point_t
{
  Imath::V3f position ;
  Imath::V3f colour ;
  int size = 3 ;
} ;

typedef enum
{
  PRIM_MESH ,
  PRIM_LINE ,
  PRIM_POINT ,
  PRIM_NONE
} primitive_kind_t ;

const char * const primitive_kind_name[]
{
  "mesh" ,
  "line" ,
  "point" ,
  "unsupported"
} ;

// a reference to one primitive of a scene. Only the pointer matching
// 'kind' is set.

struct primitive_t
{
  primitive_kind_t kind = PRIM_NONE ;
  const mesh_t * p_mesh = nullptr ;
  const line_t * p_line = nullptr ;
  const point_t * p_point = nullptr ;
} ;

struct scene_t
{
  mesh_t mesh ;
  std::vector < line_t > lines ;
  std::vector < point_t > points ;

  // flatten the scene into a sequence of primitives: the mesh (if it
  // has any triangles) first, then the lines, then the points. The
  // primitives refer to the scene's data and are invalidated when
  // the scene is modified.

  std::vector < primitive_t > primitives() const ;
} ;

struct renderer_t
{
  virtual ~renderer_t() {}

  // point the renderer at a scene. The scene is referenced, not copied,
  // and must outlive it's use by the renderer.

  virtual void set_scene ( const scene_t & scene ) = 0 ;

  // render the scene for the given camera pose. The image must have the
  // size given in the pose's intrinsics. Returns false on failure.

  virtual bool render ( const camera_pose_t & pose , image_t & image ) = 0 ;
} ;

// software rasterizer with a z-buffer. Triangles are drawn from both
// sides, with the vertex colours interpolated perspective-correctly.
// Triangles with a vertex at or behind the near plane are skipped.

struct normal_renderer_t
: public renderer_t
{
  const scene_t * p_scene = nullptr ;
  double near_plane = 1e-3 ;

  void set_scene ( const scene_t & scene ) ;

  bool render ( const camera_pose_t & pose , image_t & image ) ;
} ;

} ; // namespace viewsynth

#endif // VIEWSYNTH_RENDER_H
