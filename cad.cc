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

// implementation of the CAD catalog: PLY and keypoint file readers

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>

#include <OpenImageIO/filesystem.h>
#include <yaml-cpp/yaml.h>

#include "cad.h"

namespace viewsynth
{

ply_type_t parse_ply_type ( const std::string & name )
{
  static const std::map < std::string , ply_type_t > alias
  {
    { "char" , PLY_INT8 } ,
    { "uchar" , PLY_UINT8 } ,
    { "short" , PLY_INT16 } ,
    { "ushort" , PLY_UINT16 } ,
    { "int" , PLY_INT32 } ,
    { "uint" , PLY_UINT32 } ,
    { "float" , PLY_FLOAT32 } ,
    { "double" , PLY_FLOAT64 }
  } ;

  for ( int i = 0 ; i < PLY_NONE ; i++ )
  {
    if ( name == ply_type_name [ i ] )
      return ply_type_t ( i ) ;
  }

  auto it = alias.find ( name ) ;
  if ( it != alias.end() )
    return it->second ;

  return PLY_NONE ;
}

namespace
{

const std::size_t ply_type_size[] { 1 , 1 , 2 , 2 , 4 , 4 , 4 , 8 } ;

struct ply_property_t
{
  std::string name ;
  ply_type_t type = PLY_NONE ;
  bool is_list = false ;
  ply_type_t count_type = PLY_NONE ;
} ;

struct ply_element_t
{
  std::string name ;
  std::size_t count = 0 ;
  std::vector < ply_property_t > properties ;
} ;

// reads single values from the body of a PLY file, either as ASCII
// tokens or as binary little-endian data.

struct ply_reader_t
{
  std::istream & str ;
  bool binary ;

  std::streamoff end = 0 ;

  ply_reader_t ( std::istream & _str , bool _binary )
  : str ( _str ) ,
    binary ( _binary )
  {
    std::streampos here = str.tellg() ;
    str.seekg ( 0 , std::ios::end ) ;
    end = str.tellg() ;
    str.seekg ( here ) ;
  }

  // bytes left in the body. Every binary value takes it's type's size,
  // every ASCII value at least one byte.

  std::size_t remaining()
  {
    std::streamoff pos = str.tellg() ;
    if ( pos < 0 || pos >= end )
      return 0 ;
    return std::size_t ( end - pos ) ;
  }

  std::size_t min_size ( ply_type_t type ) const
  {
    return binary ? ply_type_size [ type ] : 1 ;
  }

  // the least number of bytes one record of 'element' can occupy

  std::size_t min_record_size ( const ply_element_t & element ) const
  {
    std::size_t size = 0 ;
    for ( const auto & property : element.properties )
      size += min_size ( property.is_list ? property.count_type
                                          : property.type ) ;
    return std::max ( size , std::size_t ( 1 ) ) ;
  }

  bool read ( ply_type_t type , double & value )
  {
    if ( ! binary )
    {
      str >> value ;
      return bool ( str ) ;
    }

    unsigned char buffer [ 8 ] ;
    std::size_t size = ply_type_size [ type ] ;
    if ( ! str.read ( (char*) buffer , size ) )
      return false ;

    // PLY's binary_little_endian matches the memory layout on the
    // platforms we build for, so we can simply copy the bytes

    switch ( type )
    {
      case PLY_INT8 :
      {
        std::int8_t v ; std::memcpy ( &v , buffer , size ) ; value = v ;
        break ;
      }
      case PLY_UINT8 :
      {
        std::uint8_t v ; std::memcpy ( &v , buffer , size ) ; value = v ;
        break ;
      }
      case PLY_INT16 :
      {
        std::int16_t v ; std::memcpy ( &v , buffer , size ) ; value = v ;
        break ;
      }
      case PLY_UINT16 :
      {
        std::uint16_t v ; std::memcpy ( &v , buffer , size ) ; value = v ;
        break ;
      }
      case PLY_INT32 :
      {
        std::int32_t v ; std::memcpy ( &v , buffer , size ) ; value = v ;
        break ;
      }
      case PLY_UINT32 :
      {
        std::uint32_t v ; std::memcpy ( &v , buffer , size ) ; value = v ;
        break ;
      }
      case PLY_FLOAT32 :
      {
        float v ; std::memcpy ( &v , buffer , size ) ; value = v ;
        break ;
      }
      case PLY_FLOAT64 :
      {
        double v ; std::memcpy ( &v , buffer , size ) ; value = v ;
        break ;
      }
      default :
        return false ;
    }
    return true ;
  }
} ;

bool ply_error ( const std::string & filename , const std::string & msg )
{
  std::cerr << "PLY file " << filename << ": " << msg << std::endl ;
  return false ;
}

// convert a value read from the body to a non-negative integer not
// exceeding 'limit'. Non-integral and non-finite values are refused.

bool to_index ( double value , std::size_t limit , std::size_t & index )
{
  if (    ! std::isfinite ( value )
       || value < 0.0
       || value > double ( limit )
       || value != std::floor ( value ) )
    return false ;

  index = std::size_t ( value ) ;
  return true ;
}

} ; // anonymous namespace

bool read_ply ( const std::string & filename , mesh_t & mesh )
{
  std::ifstream str ( filename , std::ios::binary ) ;
  if ( ! str )
    return ply_error ( filename , "can't open file" ) ;

  mesh.clear() ;

  // parse the header

  std::string line ;
  if ( ! std::getline ( str , line ) || line.compare ( 0 , 3 , "ply" ) != 0 )
    return ply_error ( filename , "not a PLY file" ) ;

  bool binary = false ;
  bool have_format = false ;
  std::vector < ply_element_t > elements ;

  while ( true )
  {
    if ( ! std::getline ( str , line ) )
      return ply_error ( filename , "header ends prematurely" ) ;

    if ( line.size() && line.back() == '\r' )
      line.pop_back() ;

    std::istringstream fields ( line ) ;
    std::string keyword ;
    fields >> keyword ;

    if ( keyword == "end_header" )
      break ;

    if ( keyword == "comment" || keyword == "obj_info" || keyword.empty() )
      continue ;

    if ( keyword == "format" )
    {
      std::string format ;
      fields >> format ;
      if ( format == "ascii" )
        binary = false ;
      else if ( format == "binary_little_endian" )
        binary = true ;
      else
        return ply_error ( filename , "unsupported format " + format ) ;
      have_format = true ;
    }
    else if ( keyword == "element" )
    {
      ply_element_t element ;
      fields >> element.name >> element.count ;
      if ( ! fields )
        return ply_error ( filename , "malformed element line: " + line ) ;
      elements.push_back ( element ) ;
    }
    else if ( keyword == "property" )
    {
      if ( elements.empty() )
        return ply_error ( filename , "property outside element" ) ;

      ply_property_t property ;
      std::string type ;
      fields >> type ;
      if ( type == "list" )
      {
        std::string count_type , item_type ;
        fields >> count_type >> item_type >> property.name ;
        property.is_list = true ;
        property.count_type = parse_ply_type ( count_type ) ;
        property.type = parse_ply_type ( item_type ) ;
        if ( property.count_type == PLY_NONE )
          return ply_error ( filename , "bad list count type " + count_type ) ;
      }
      else
      {
        fields >> property.name ;
        property.type = parse_ply_type ( type ) ;
      }
      if ( property.type == PLY_NONE || ! fields )
        return ply_error ( filename , "malformed property line: " + line ) ;
      elements.back().properties.push_back ( property ) ;
    }
    else
    {
      return ply_error ( filename , "unknown header keyword " + keyword ) ;
    }
  }

  if ( ! have_format )
    return ply_error ( filename , "no format line" ) ;

  // read the body, element by element, in the order of the header

  ply_reader_t reader ( str , binary ) ;

  for ( const auto & element : elements )
  {
    bool is_vertex = ( element.name == "vertex" ) ;
    bool is_face = ( element.name == "face" ) ;

    std::size_t records =   reader.remaining()
                          / reader.min_record_size ( element ) ;
    if ( element.count > records )
      return ply_error ( filename , "element count of '" + element.name
                                   + "' exceeds the data" ) ;

    for ( std::size_t i = 0 ; i < element.count ; i++ )
    {
      double xyz [ 3 ] = { 0.0 , 0.0 , 0.0 } ;
      std::vector < int > indices ;

      for ( const auto & property : element.properties )
      {
        if ( property.is_list )
        {
          double count ;
          if ( ! reader.read ( property.count_type , count ) )
            return ply_error ( filename , "unexpected end of data" ) ;

          bool want = is_face && (    property.name == "vertex_indices"
                                   || property.name == "vertex_index" ) ;

          std::size_t n ;
          std::size_t limit =   reader.remaining()
                              / reader.min_size ( property.type ) ;
          if ( ! to_index ( count , limit , n ) )
            return ply_error ( filename , "bad list length" ) ;

          for ( std::size_t k = 0 ; k < n ; k++ )
          {
            double value ;
            if ( ! reader.read ( property.type , value ) )
              return ply_error ( filename , "unexpected end of data" ) ;

            if ( want )
            {
              std::size_t index ;
              if ( ! to_index ( value , std::numeric_limits<int>::max() ,
                                index ) )
                return ply_error ( filename , "face index out of range" ) ;
              indices.push_back ( int ( index ) ) ;
            }
          }
        }
        else
        {
          double value ;
          if ( ! reader.read ( property.type , value ) )
            return ply_error ( filename , "unexpected end of data" ) ;

          if ( is_vertex )
          {
            if ( property.name == "x" )
              xyz [ 0 ] = value ;
            else if ( property.name == "y" )
              xyz [ 1 ] = value ;
            else if ( property.name == "z" )
              xyz [ 2 ] = value ;
          }
        }
      }

      if ( is_vertex )
      {
        mesh.vertices.push_back ( Imath::V3f ( xyz[0] , xyz[1] , xyz[2] ) ) ;
      }
      else if ( is_face )
      {
        // fan triangulation

        for ( std::size_t k = 2 ; k < indices.size() ; k++ )
          mesh.triangles.push_back
            ( Imath::V3i ( indices[0] , indices[k-1] , indices[k] ) ) ;
      }
    }
  }

  int nv = mesh.vertices.size() ;
  for ( const auto & tri : mesh.triangles )
  {
    for ( int k = 0 ; k < 3 ; k++ )
    {
      if ( tri [ k ] < 0 || tri [ k ] >= nv )
        return ply_error ( filename , "face index out of range" ) ;
    }
  }

  compute_vertex_normals ( mesh ) ;

  if ( args.verbose )
    std::cout << "read " << filename << ": " << mesh.vertices.size()
              << " vertices, " << mesh.triangles.size() << " triangles"
              << std::endl ;

  return true ;
}

bool read_kpoints ( const std::string & filename , kpoint3_map_t & kp3 )
{
  kp3.clear() ;

  try
  {
    YAML::Node root = YAML::LoadFile ( filename ) ;
    const YAML::Node & kpoints = root [ "kpoints_3d" ] ;

    if ( ! kpoints.IsMap() )
    {
      std::cerr << "keypoint file " << filename
                << ": 'kpoints_3d' must be a map" << std::endl ;
      return false ;
    }

    for ( const auto & kp : kpoints )
    {
      auto name = kp.first.as < std::string > () ;
      auto xyz = kp.second.as < std::vector < double > > () ;
      if ( xyz.size() != 3 )
      {
        std::cerr << "keypoint file " << filename << ": keypoint "
                  << name << " needs three coordinates" << std::endl ;
        return false ;
      }
      kp3 [ name ] = Imath::V3d ( xyz[0] , xyz[1] , xyz[2] ) ;
    }
  }
  catch ( const YAML::Exception & e )
  {
    std::cerr << "failed to read keypoint file " << filename
              << ": " << e.what() << std::endl ;
    return false ;
  }

  return true ;
}

std::string cad_catalog_t::mesh_name ( int idx ) const
{
  char buffer [ 16 ] ;
  std::snprintf ( buffer , 16 , "%03d" , idx ) ;
  return   cad_root + "/pascal_" + object_class_name [ cls ]
         + "_cad_" + buffer + ".ply" ;
}

std::string cad_catalog_t::kpoint_name ( int idx ) const
{
  char buffer [ 16 ] ;
  std::snprintf ( buffer , 16 , "%03d" , idx ) ;
  return   cad_root + "/pascal_" + object_class_name [ cls ]
         + "_cad_" + buffer + ".yaml" ;
}

bool cad_catalog_t::validate() const
{
  if ( ! OIIO::Filesystem::is_directory ( cad_root ) )
  {
    std::cerr << "CAD root " << cad_root << " is not a directory"
              << std::endl ;
    return false ;
  }

  bool complete = true ;
  for ( int idx = 0 ; idx < catalog_size() ; idx++ )
  {
    for ( const auto & name : { mesh_name ( idx ) , kpoint_name ( idx ) } )
    {
      if ( ! OIIO::Filesystem::is_regular ( name ) )
      {
        std::cerr << "missing CAD catalog entry " << name << std::endl ;
        complete = false ;
      }
    }
  }
  return complete ;
}

bool cad_catalog_t::load ( int idx , mesh_t & mesh , kpoint3_map_t & kp3 )
{
  if ( idx < 0 || idx >= catalog_size() )
  {
    std::cerr << "CAD index " << idx << " out of range" << std::endl ;
    return false ;
  }

  if ( args.verbose )
    std::cout << "loading CAD model " << idx << std::endl ;

  return    read_ply ( mesh_name ( idx ) , mesh )
         && read_kpoints ( kpoint_name ( idx ) , kp3 ) ;
}

} ; // namespace viewsynth
