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

// The CAD catalog holds a fixed number of 3D models per object class.
// Each model comes as a PLY mesh and a YAML file with the 3D positions
// of the class' semantic keypoints. The files are named after the
// PASCAL3D+ convention:
//
//   <cad_root>/pascal_<class>_cad_<idx>.ply
//   <cad_root>/pascal_<class>_cad_<idx>.yaml
//
// where <idx> has three digits. The YAML file looks like this:
//
//   kpoints_3d:
//     seat_upper_left: [ -0.2 , 0.25 , 0.1 ]
//     ...

#ifndef VIEWSYNTH_CAD_H
#define VIEWSYNTH_CAD_H

#include <string>

#include "camera.h"
#include "render.h"

namespace viewsynth
{

// value types which can occur in a PLY file

typedef enum
{
  PLY_INT8 ,
  PLY_UINT8 ,
  PLY_INT16 ,
  PLY_UINT16 ,
  PLY_INT32 ,
  PLY_UINT32 ,
  PLY_FLOAT32 ,
  PLY_FLOAT64 ,
  PLY_NONE
} ply_type_t ;

const char * const ply_type_name[]
{
  "int8" ,
  "uint8" ,
  "int16" ,
  "uint16" ,
  "int32" ,
  "uint32" ,
  "float32" ,
  "float64" ,
  "unsupported"
} ;

// PLY also has the old type names 'char', 'uchar' etc.

ply_type_t parse_ply_type ( const std::string & name ) ;

// read a PLY mesh. We can read ASCII and binary little-endian files.
// Only the vertex positions and the faces' vertex index lists are
// used, polygons are fan-triangulated. Returns false if the file
// can't be read or is malformed.

bool read_ply ( const std::string & filename , mesh_t & mesh ) ;

// read the 3D keypoints from a YAML file

bool read_kpoints ( const std::string & filename , kpoint3_map_t & kp3 ) ;

// the mesh/keypoint store interface used by the session

struct mesh_store_t
{
  virtual ~mesh_store_t() {}

  virtual int catalog_size() const = 0 ;

  // load model 'idx': the mesh (with normals and normal colours) and
  // the keypoints. Returns false on failure, then the arguments are
  // left in an unspecified state.

  virtual bool load ( int idx , mesh_t & mesh , kpoint3_map_t & kp3 ) = 0 ;
} ;

// the CAD catalog on disk

struct cad_catalog_t
: public mesh_store_t
{
  std::string cad_root ;
  object_class_t cls ;

  cad_catalog_t ( const std::string & _cad_root , object_class_t _cls )
  : cad_root ( _cad_root ) ,
    cls ( _cls )
  { }

  std::string mesh_name ( int idx ) const ;
  std::string kpoint_name ( int idx ) const ;

  // check that all catalog entries are present. Missing files are
  // reported on std::cerr.

  bool validate() const ;

  int catalog_size() const
  {
    return viewsynth::catalog_size ;
  }

  bool load ( int idx , mesh_t & mesh , kpoint3_map_t & kp3 ) ;
} ;

} ; // namespace viewsynth

#endif // VIEWSYNTH_CAD_H
