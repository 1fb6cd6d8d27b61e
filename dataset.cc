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

// implementation of the on-disk texture dataset

#include <algorithm>

#include <OpenImageIO/filesystem.h>
#include <yaml-cpp/yaml.h>

#include "dataset.h"

namespace viewsynth
{

bool texture_dataset_t::scan()
{
  records.clear() ;

  if ( ! OIIO::Filesystem::is_directory ( directory ) )
  {
    std::cerr << "dataset directory " << directory
              << " is not a directory" << std::endl ;
    return false ;
  }

  std::vector < std::string > entries ;
  if ( ! OIIO::Filesystem::get_directory_entries ( directory , entries ) )
  {
    std::cerr << "can't list dataset directory " << directory << std::endl ;
    return false ;
  }

  for ( const auto & entry : entries )
  {
    if (    OIIO::Filesystem::is_directory ( entry )
         && OIIO::Filesystem::is_regular ( entry + "/meta.yaml" ) )
      records.push_back ( entry ) ;
  }

  std::sort ( records.begin() , records.end() ) ;

  if ( fast_load && records.size() > fast_load_records )
    records.resize ( fast_load_records ) ;

  if ( args.verbose )
    std::cout << "dataset " << directory << ": " << records.size()
              << " records" << ( fast_load ? " (fast load)" : "" )
              << std::endl ;

  if ( records.empty() )
  {
    std::cerr << "dataset directory " << directory
              << " has no records" << std::endl ;
    return false ;
  }
  return true ;
}

bool texture_dataset_t::load ( std::size_t index , example_ptr_t & example )
{
  if ( index >= records.size() )
  {
    std::cerr << "dataset index " << index << " out of range" << std::endl ;
    return false ;
  }

  const std::string & record ( records [ index ] ) ;
  std::string meta_name = record + "/meta.yaml" ;

  std::size_t n = plane_count ( cls ) ;
  example_ptr_t p_ex ( new texture_example_t ( frame_size , frame_size , n ) ) ;
  p_ex->name = OIIO::Filesystem::filename ( record ) ;

  std::string src_name , central_name ;
  std::vector < std::string > plane_names ( n ) ;

  try
  {
    YAML::Node meta = YAML::LoadFile ( meta_name ) ;

    src_name = meta [ "src_image" ] . as < std::string > () ;
    central_name = meta [ "central" ] . as < std::string > () ;

    const YAML::Node & planes = meta [ "planes" ] ;
    if ( ! planes.IsSequence() || planes.size() != n )
    {
      std::cerr << meta_name << ": 'planes' must be a sequence of " << n
                << " entries for class " << object_class_name [ cls ]
                << std::endl ;
      return false ;
    }

    for ( std::size_t i = 0 ; i < n ; i++ )
    {
      const YAML::Node & plane = planes [ i ] ;
      bool visible = plane [ "visible" ] . as < bool > () ;
      auto & kpoints ( p_ex->layout.kpoints [ i ] ) ;
      kpoints.clear() ;

      if ( plane [ "kpoints" ] )
      {
        for ( const auto & kp : plane [ "kpoints" ] )
        {
          auto xy = kp.as < std::vector < double > > () ;
          if ( xy.size() != 2 )
          {
            std::cerr << meta_name << ": plane " << i
                      << " has a keypoint without two coordinates"
                      << std::endl ;
            return false ;
          }
          kpoints.push_back ( v2_t { float ( xy[0] ) , float ( xy[1] ) } ) ;
        }
      }

      if ( visible && kpoints.size() != plane_defs ( cls ) [ i ] .kpoints.size() )
      {
        std::cerr << meta_name << ": visible plane " << i << " has "
                  << kpoints.size() << " keypoints, expected "
                  << plane_defs ( cls ) [ i ] .kpoints.size() << std::endl ;
        return false ;
      }

      if ( visible )
        plane_names [ i ] = plane [ "image" ] . as < std::string > () ;

      p_ex->layout.visible [ i ] = visible ;
    }
  }
  catch ( const YAML::Exception & e )
  {
    std::cerr << "failed to read " << meta_name << ": " << e.what()
              << std::endl ;
    return false ;
  }

  if (    ! read_image ( record + "/" + src_name , p_ex->src_image )
       || ! read_image ( record + "/" + central_name , p_ex->central ) )
    return false ;

  px_t blank ;
  blank = 0.0f ;

  for ( std::size_t i = 0 ; i < n ; i++ )
  {
    auto slice = stack_slice ( p_ex->planes , i ) ;
    if ( p_ex->layout.visible [ i ] )
    {
      if ( ! read_image ( record + "/" + plane_names [ i ] , slice ) )
        return false ;
    }
    else
    {
      slice.set_data ( blank ) ;
    }
  }

  if ( args.verbose )
    std::cout << "loaded dataset record " << index << ": " << p_ex->name
              << std::endl ;

  example = p_ex ;
  return true ;
}

} ; // namespace viewsynth
