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

// The plane resolver determines, for a given viewpoint, where the
// object's planes appear in the image and whether they are visible.
// The keypoint positions come from the keypoint projector, visibility
// is decided by a 'visibility predicate'. We provide two predicates:
// a table gleaned from a YAML file, which holds visibility flags per
// CAD model and viewpoint bucket, and a geometric predicate which
// looks at the winding of the projected plane polygon. The table
// falls back to the geometric predicate for viewpoints it doesn't
// cover.

#ifndef VIEWSYNTH_PLANES_H
#define VIEWSYNTH_PLANES_H

#include <map>
#include <memory>
#include <tuple>
#include <vector>

#include "camera.h"

namespace viewsynth
{

// the layout of a set of planes as seen from one viewpoint: for each
// plane of the class (in canonical order) the positions of it's
// defining keypoints in normalized image coordinates and a visibility
// flag. This is used both for the source layout (coming with a texture
// example) and the target layout (produced for the current viewpoint).

struct plane_layout_t
{
  std::vector < std::vector < v2_t > > kpoints ;
  std::vector < bool > visible ;

  std::size_t size() const
  {
    return visible.size() ;
  }

  void resize ( std::size_t n )
  {
    kpoints.resize ( n ) ;
    visible.resize ( n , false ) ;
  }
} ;

// what a visibility predicate is asked about

struct view_query_t
{
  object_class_t cls ;
  int cad_idx ;
  double azimuth ;
  double elevation ;
  const kpoint2_map_t * p_kp2 ;
} ;

// visibility predicates return one flag per plane of the class, in
// canonical order.

struct visibility_predicate_t
{
  virtual ~visibility_predicate_t() {}

  virtual std::vector < bool > visibility
    ( const view_query_t & query ) const = 0 ;
} ;

// signed area of a polygon given in image coordinates (y down).
// front-facing planes - with their keypoints in TL, TR, BR, BL order -
// yield positive values.

double signed_area ( const std::vector < v2_t > & polygon ) ;

// a plane is deemed visible if it's projection is front-facing and
// not degenerate.

struct winding_visibility_t
: public visibility_predicate_t
{
  double min_area = 1e-4 ;

  std::vector < bool > visibility ( const view_query_t & query ) const ;
} ;

// round an angle to the nearest multiple of 'step', wrapping azimuths
// to [0,360).

int vpoint_bucket ( double angle , int step , bool wrap ) ;

struct visibility_table_t
: public visibility_predicate_t
{
  int azimuth_step = 15 ;
  int elevation_step = 15 ;

  // key: cad index, azimuth bucket, elevation bucket

  typedef std::tuple < int , int , int > bucket_key_t ;
  std::map < bucket_key_t , std::vector < bool > > table ;

  winding_visibility_t fallback ;

  // load the table from a YAML file. returns false if the file can't
  // be read or doesn't have the expected structure.

  bool load ( const std::string & filename , object_class_t cls ) ;

  std::vector < bool > visibility ( const view_query_t & query ) const ;
} ;

// the name of the visibility table for a class in a CAD root directory

std::string visibility_table_name ( const std::string & cad_root ,
                                    object_class_t cls ) ;

// resolve the target plane layout for the current viewpoint: collect
// each plane's keypoints and ask the predicate for visibility. Planes
// whose keypoints aren't all available come out invisible, with their
// keypoints set to the frame center.

void resolve_planes ( object_class_t cls ,
                      int cad_idx ,
                      const viewpoint_t & viewpoint ,
                      const kpoint2_map_t & kp2 ,
                      const visibility_predicate_t & predicate ,
                      plane_layout_t & layout ) ;

} ; // namespace viewsynth

#endif // VIEWSYNTH_PLANES_H
