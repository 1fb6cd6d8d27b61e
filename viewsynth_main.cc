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

// viewsynth's main program. The command line is processed into the
// global 'args' object, then the collaborators are set up and the
// session consumes keystrokes from stdin until EOF. Each keystroke is
// one event, and every event is followed by a pipeline pass.

#include <OpenImageIO/filesystem.h>
#include <OpenImageIO/argparse.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include "viewsynth_basic.h"
#include "cad.h"
#include "dataset.h"
#include "frame_sink.h"
#include "planes.h"
#include "render.h"
#include "session.h"
#include "synthesis.h"

using namespace viewsynth ;

using OIIO::ArgParse ;
using OIIO::Filesystem::convert_native_arguments ;

namespace
{

// configuration errors are fatal

void config_error ( const std::string & msg )
{
  std::cerr << "viewsynth: " << msg << std::endl ;
  exit ( 1 ) ;
}

} ; // anonymous namespace

void viewsynth::arguments::init ( int argc , const char ** argv )
{
  convert_native_arguments ( argc , (const char**) argv ) ;
  ArgParse ap ;

  ap.intro ( "viewsynth: interactive novel view synthesis from keypoints\n" )
    .usage ( "viewsynth [options...] --class CLASS --dataset DIR "
             "--cad_root DIR" ) ;

  ap.arg ( "-v" , &verbose )
    .help ( "Verbose output" ) ;

  ap.arg ( "--verbose" , &verbose )
    .help ( "same as -v" ) ;

  ap.separator ( "  mandatory options:" ) ;

  ap.arg ( "--class CLASS" )
    .help ( "object class: 'car' or 'chair'" )
    .metavar ( "CLASS" ) ;

  ap.arg ( "--dataset DIR" )
    .help ( "texture dataset directory" )
    .metavar ( "DIR" ) ;

  ap.arg ( "--cad_root DIR" )
    .help ( "directory holding the CAD catalog" )
    .metavar ( "DIR" ) ;

  ap.separator ( "  additional options:" ) ;

  ap.arg ( "--model MODEL" )
    .help ( "synthesis model (default: 'composite')" )
    .metavar ( "MODEL" ) ;

  ap.arg ( "--dump_dir DIR" )
    .help ( "directory for dumped frames (default: /tmp)" )
    .metavar ( "DIR" ) ;

  ap.arg ( "--device DEVICE" )
    .help ( "compute device: 'cpu' (default) or 'cuda'" )
    .metavar ( "DEVICE" ) ;

  ap.arg ( "--preview FILE" )
    .help ( "write the live frame to FILE on every tick" )
    .metavar ( "FILE" ) ;

  ap.arg ( "--size EXTENT" )
    .help ( "frame edge length in pixels (default: 128)" )
    .metavar ( "EXTENT" ) ;

  ap.arg ( "--focal FOCAL" )
    .help ( "camera focal length in pixels (default: 1000)" )
    .metavar ( "FOCAL" ) ;

  ap.arg ( "--demo" , &demo )
    .help ( "fast-load mode: use only the first 100 dataset records" ) ;

  if ( ap.parse ( argc , argv ) < 0 )
  {
    std::cerr << ap.geterror() << std::endl ;
    ap.print_help() ;
    exit ( 1 ) ;
  }

  class_str = ap["class"].as_string ( "" ) ;
  dataset_dir = ap["dataset"].as_string ( "" ) ;
  cad_root = ap["cad_root"].as_string ( "" ) ;
  model = ap["model"].as_string ( "composite" ) ;
  dump_dir = ap["dump_dir"].as_string ( "/tmp" ) ;
  device = ap["device"].as_string ( "cpu" ) ;
  preview = ap["preview"].as_string ( "" ) ;
  size = ap["size"].get<int> ( 128 ) ;
  focal = ap["focal"].get<double> ( 1000.0 ) ;

  object_class = parse_object_class ( class_str ) ;
  if ( object_class == CLS_NONE )
    config_error ( "unknown object class '" + class_str
                   + "', use 'car' or 'chair'" ) ;

  if ( dataset_dir.empty() )
    config_error ( "pass the texture dataset directory with --dataset" ) ;

  if ( cad_root.empty() )
    config_error ( "pass the CAD catalog directory with --cad_root" ) ;

  if ( ! OIIO::Filesystem::is_directory ( cad_root ) )
    config_error ( "CAD root " + cad_root + " is not a directory" ) ;

  // only the built-in baseline is linked. A model file would need a
  // learned backend.

  if ( model != "composite" )
    config_error ( "model '" + model + "' is not available, "
                   "the only supported model is 'composite'" ) ;

  if ( device != "cpu" && device != "cuda" )
    config_error ( "unknown device '" + device + "', use 'cpu' or 'cuda'" ) ;

  if ( device == "cuda" && verbose )
    std::cout << "no GPU backend is linked, running on the CPU"
              << std::endl ;

  if ( ! OIIO::Filesystem::is_directory ( dump_dir ) )
    config_error ( "dump directory " + dump_dir + " does not exist" ) ;

  if ( size < 8 )
    config_error ( "frame size must be at least 8 pixels" ) ;

  if ( focal <= 0.0 )
    config_error ( "focal length must be positive" ) ;

  if ( verbose )
  {
    std::cout << "class:    " << object_class_name [ object_class ]
              << std::endl ;
    std::cout << "dataset:  " << dataset_dir
              << ( demo ? " (fast load)" : "" ) << std::endl ;
    std::cout << "CAD root: " << cad_root << std::endl ;
    std::cout << "model:    " << model << " on " << device << std::endl ;
    std::cout << "frame:    " << size << " x " << size
              << ", focal length " << focal << std::endl ;
  }
}

int main ( int argc , const char ** argv )
{
  args.init ( argc , argv ) ;

  object_class_t cls = args.object_class ;

  texture_dataset_t dataset ( args.dataset_dir , cls , args.size , args.demo ) ;
  if ( ! dataset.scan() )
    config_error ( "no usable records in dataset " + args.dataset_dir ) ;

  cad_catalog_t catalog ( args.cad_root , cls ) ;
  if ( ! catalog.validate() )
    config_error ( "CAD catalog in " + args.cad_root + " is incomplete" ) ;

  // use the precomputed visibility table if there is one, otherwise
  // decide visibility from the winding of the projected planes

  winding_visibility_t winding ;
  visibility_table_t table ;
  const visibility_predicate_t * p_visibility = &winding ;

  std::string table_name = visibility_table_name ( args.cad_root , cls ) ;
  if ( OIIO::Filesystem::is_regular ( table_name ) )
  {
    if ( ! table.load ( table_name , cls ) )
      config_error ( "can't use visibility table " + table_name ) ;
    p_visibility = &table ;
    if ( args.verbose )
      std::cout << "using visibility table " << table_name << std::endl ;
  }

  normal_renderer_t renderer ;
  composite_model_t model ( cls , CS_LAB ) ;
  image_file_sink_t sink ( args.dump_dir , args.preview ) ;

  collaborators_t collab ;
  collab.p_renderer = &renderer ;
  collab.p_mesh_store = &catalog ;
  collab.p_dataset = &dataset ;
  collab.p_visibility = p_visibility ;
  collab.p_model = &model ;
  collab.p_sink = &sink ;

  session_t session ( cls , args.size , args.focal , collab ) ;

  if ( ! session.start() )
  {
    std::cerr << "viewsynth: session failed to start" << std::endl ;
    return 1 ;
  }

  std::cout << key_help << std::endl ;

  // one keystroke, one event. Whitespace separating the keys is
  // ignored, unknown keys become unsupported events.

  int c ;
  while ( ( c = std::getchar() ) != EOF )
  {
    if ( c == '\n' || c == '\r' || c == '\t' )
      continue ;
    session.tick ( key_to_event ( c ) ) ;
  }

  if ( args.verbose )
    std::cout << "input has reached EOF" << std::endl ;

  return 0 ;
}
