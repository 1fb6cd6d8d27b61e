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

// implementation of the plane resolver and the visibility predicates

#include <yaml-cpp/yaml.h>

#include "planes.h"

namespace viewsynth
{

double signed_area ( const std::vector < v2_t > & polygon )
{
  double area = 0.0 ;
  std::size_t n = polygon.size() ;
  for ( std::size_t i = 0 ; i < n ; i++ )
  {
    const v2_t & a ( polygon [ i ] ) ;
    const v2_t & b ( polygon [ ( i + 1 ) % n ] ) ;
    area += double ( a[0] ) * b[1] - double ( b[0] ) * a[1] ;
  }
  return area / 2.0 ;
}

std::vector < bool > winding_visibility_t::visibility
  ( const view_query_t & query ) const
{
  const auto & defs ( plane_defs ( query.cls ) ) ;
  std::vector < bool > result ( defs.size() , false ) ;

  if ( query.p_kp2 == nullptr )
    return result ;

  for ( std::size_t i = 0 ; i < defs.size() ; i++ )
  {
    std::vector < v2_t > polygon ;
    for ( const auto & name : defs[i].kpoints )
    {
      auto it = query.p_kp2->find ( name ) ;
      if ( it == query.p_kp2->end() )
        break ;
      polygon.push_back ( it->second ) ;
    }
    if ( polygon.size() == defs[i].kpoints.size() )
      result [ i ] = ( signed_area ( polygon ) > min_area ) ;
  }
  return result ;
}

int vpoint_bucket ( double angle , int step , bool wrap )
{
  int bucket = int ( std::round ( angle / step ) ) * step ;
  if ( wrap )
  {
    bucket %= 360 ;
    if ( bucket < 0 )
      bucket += 360 ;
  }
  return bucket ;
}

std::string visibility_table_name ( const std::string & cad_root ,
                                    object_class_t cls )
{
  return   cad_root + "/pascal_"
         + object_class_name [ cls ] + "_visibility.yaml" ;
}

// The visibility table is a YAML file like this:
//
// azimuth_step: 15
// elevation_step: 15
// views:
//   - cad: 0
//     azimuth: 90
//     elevation: 0
//     visible: [ true , false , true , true , false ]
//
// 'visible' must have one entry per plane of the class.

bool visibility_table_t::load ( const std::string & filename ,
                                object_class_t cls )
{
  std::size_t n = plane_count ( cls ) ;

  try
  {
    YAML::Node root = YAML::LoadFile ( filename ) ;

    if ( root [ "azimuth_step" ] )
      azimuth_step = root [ "azimuth_step" ] . as < int > () ;
    if ( root [ "elevation_step" ] )
      elevation_step = root [ "elevation_step" ] . as < int > () ;

    if ( azimuth_step <= 0 || elevation_step <= 0 )
    {
      std::cerr << "visibility table " << filename
                << ": step sizes must be positive" << std::endl ;
      return false ;
    }

    const YAML::Node & views = root [ "views" ] ;
    if ( ! views.IsSequence() )
    {
      std::cerr << "visibility table " << filename
                << ": 'views' must be a sequence" << std::endl ;
      return false ;
    }

    table.clear() ;
    for ( const auto & view : views )
    {
      int cad = view [ "cad" ] . as < int > () ;
      int az = vpoint_bucket ( view [ "azimuth" ] . as < double > () ,
                               azimuth_step , true ) ;
      int el = vpoint_bucket ( view [ "elevation" ] . as < double > () ,
                               elevation_step , false ) ;
      auto flags = view [ "visible" ] . as < std::vector < bool > > () ;
      if ( flags.size() != n )
      {
        std::cerr << "visibility table " << filename << ": view with "
                  << flags.size() << " flags, but class "
                  << object_class_name [ cls ] << " has " << n
                  << " planes" << std::endl ;
        return false ;
      }
      table [ bucket_key_t ( cad , az , el ) ] = flags ;
    }
  }
  catch ( const YAML::Exception & e )
  {
    std::cerr << "failed to load visibility table " << filename
              << ": " << e.what() << std::endl ;
    return false ;
  }

  if ( args.verbose )
    std::cout << "loaded " << table.size() << " views from visibility table "
              << filename << std::endl ;

  return true ;
}

std::vector < bool > visibility_table_t::visibility
  ( const view_query_t & query ) const
{
  bucket_key_t key ( query.cad_idx ,
              vpoint_bucket ( query.azimuth , azimuth_step , true ) ,
              vpoint_bucket ( query.elevation , elevation_step , false ) ) ;

  auto it = table.find ( key ) ;
  if ( it != table.end() )
    return it->second ;

  return fallback.visibility ( query ) ;
}

void resolve_planes ( object_class_t cls ,
                      int cad_idx ,
                      const viewpoint_t & viewpoint ,
                      const kpoint2_map_t & kp2 ,
                      const visibility_predicate_t & predicate ,
                      plane_layout_t & layout )
{
  const auto & defs ( plane_defs ( cls ) ) ;
  std::size_t n = defs.size() ;

  layout.resize ( n ) ;

  view_query_t query { cls , cad_idx ,
                       viewpoint.azimuth , viewpoint.elevation ,
                       &kp2 } ;

  auto flags = predicate.visibility ( query ) ;

  for ( std::size_t i = 0 ; i < n ; i++ )
  {
    auto & points ( layout.kpoints [ i ] ) ;
    points.clear() ;
    bool complete = true ;

    for ( const auto & name : defs[i].kpoints )
    {
      auto it = kp2.find ( name ) ;
      if ( it != kp2.end() )
      {
        points.push_back ( it->second ) ;
      }
      else
      {
        points.push_back ( v2_t { 0.0f , 0.0f } ) ;
        complete = false ;
      }
    }

    layout.visible [ i ] = complete && i < flags.size() && flags [ i ] ;

    if ( ! complete && args.verbose )
      std::cout << "plane " << defs[i].name
                << " lacks keypoints, treated as invisible" << std::endl ;
  }
}

} ; // namespace viewsynth
