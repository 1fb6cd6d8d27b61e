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

// this file has some helper functions which don't use zimt's SIMD code
// and which aren't performance-critical: the tables describing the
// object classes, key bindings, dump file naming and image file I/O.

#include <cstdio>
#include <cctype>
#include <OpenImageIO/imageio.h>
#include <OpenImageIO/imagebuf.h>
#include <OpenImageIO/imagebufalgo.h>
#include <OpenImageIO/filesystem.h>

#include "common.h"

using OIIO::TypeDesc ;
using OIIO::ImageSpec ;

namespace viewsynth
{

// the global configuration object. It's filled in by arguments::init
// which is called from main - if it isn't, the defaults apply, which
// is what the unit tests rely on.

arguments args ;

object_class_t parse_object_class ( const std::string & name )
{
  for ( int i = 0 ; i < CLS_NONE ; i++ )
  {
    if ( name == object_class_name [ i ] )
      return object_class_t ( i ) ;
  }
  return CLS_NONE ;
}

// the plane definitions use PASCAL3D+ keypoint names. For cars, the
// planes are the two flanks, the roof and the front and rear.

static const std::vector < plane_def_t > car_planes
{
  { "left" ,  { "upper_left_windshield" , "upper_left_rearwindow" ,
                "left_back_wheel" , "left_front_wheel" } } ,
  { "right" , { "upper_right_rearwindow" , "upper_right_windshield" ,
                "right_front_wheel" , "right_back_wheel" } } ,
  { "roof" ,  { "upper_left_windshield" , "upper_right_windshield" ,
                "upper_right_rearwindow" , "upper_left_rearwindow" } } ,
  { "front" , { "upper_right_windshield" , "upper_left_windshield" ,
                "left_front_light" , "right_front_light" } } ,
  { "back" ,  { "upper_left_rearwindow" , "upper_right_rearwindow" ,
                "right_back_trunk" , "left_back_trunk" } }
} ;

// chairs have a backrest, a seat and two sides

static const std::vector < plane_def_t > chair_planes
{
  { "back" ,  { "back_upper_left" , "back_upper_right" ,
                "seat_upper_right" , "seat_upper_left" } } ,
  { "seat" ,  { "seat_upper_left" , "seat_upper_right" ,
                "seat_lower_right" , "seat_lower_left" } } ,
  { "left" ,  { "seat_upper_left" , "seat_lower_left" ,
                "leg_lower_left" , "leg_upper_left" } } ,
  { "right" , { "seat_lower_right" , "seat_upper_right" ,
                "leg_upper_right" , "leg_lower_right" } }
} ;

static const std::vector < plane_def_t > no_planes ;

const std::vector < plane_def_t > & plane_defs ( object_class_t cls )
{
  switch ( cls )
  {
    case CLS_CAR:
      return car_planes ;
    case CLS_CHAIR:
      return chair_planes ;
    default:
      return no_planes ;
  }
}

std::size_t plane_count ( object_class_t cls )
{
  return plane_defs ( cls ) . size() ;
}

std::size_t input_channels ( object_class_t cls )
{
  return 3 + 3 + 3 * plane_count ( cls ) ;
}

event_t key_to_event ( int key )
{
  switch ( std::toupper ( key ) )
  {
    case 'F':
      return EV_ROTATE_UP ;
    case 'D':
      return EV_ROTATE_DOWN ;
    case 'A':
      return EV_ROTATE_LEFT ;
    case 'S':
      return EV_ROTATE_RIGHT ;
    case 'G':
      return EV_ZOOM_IN ;
    case 'H':
      return EV_ZOOM_OUT ;
    case ' ':
      return EV_NEXT_EXAMPLE ;
    case 'N':
      return EV_NEXT_MODEL ;
    case 'X':
      return EV_DUMP_FRAME ;
    case 'R':
    case '0':
      return EV_NO_OP ;
    default:
      return EV_NONE ;
  }
}

const char * const key_help =
R"(viewsynth key bindings (type a key, then press return):

  F      rotate up (pitch +5 degrees)
  D      rotate down (pitch -5 degrees)
  S      rotate right (yaw +5 degrees)
  A      rotate left (yaw -5 degrees)
  H      zoom out (radius +0.05)
  G      zoom in (radius -0.05)
  space  next texture example
  N      next CAD model
  X      dump the current frame
  R, 0   re-render without change

end of input terminates the session.
)" ;

std::string dump_name ( int dump_id , int elevation ,
                        int azimuth , int radius )
{
  char buffer [ 64 ] ;
  std::snprintf ( buffer , 64 , "%03d_el_%03d_az_%03d_rad_%03d" ,
                  dump_id , elevation , azimuth , radius ) ;
  return std::string ( buffer ) ;
}

// read_image pulls in image data with OIIO. We let OIIO convert the
// data to float on reading, then resample to the target size if
// necessary and finally fetch the pixels into a float buffer from
// which the three-channel target is filled.

bool read_image ( const std::string & filename , image_view_t trg )
{
  if ( args.verbose )
    std::cout << "file " << filename
              << " is now loaded from disk" << std::endl ;

  OIIO::ImageBuf read_buf ( filename ) ;

  if ( ! read_buf.read ( 0 , 0 , true , TypeDesc::FLOAT ) )
  {
    std::cerr << "failed to read image '" << filename << "': "
              << read_buf.geterror() << std::endl ;
    return false ;
  }

  int w = trg.shape[0] ;
  int h = trg.shape[1] ;
  int nch = read_buf.nchannels() ;

  OIIO::ImageBuf sized_buf ;
  const OIIO::ImageBuf * p_buf = &read_buf ;

  if ( read_buf.spec().width != w || read_buf.spec().height != h )
  {
    if ( args.verbose )
      std::cout << "resampling " << filename << " from "
                << read_buf.spec().width << "x" << read_buf.spec().height
                << " to " << w << "x" << h << std::endl ;

    OIIO::ROI roi ( 0 , w , 0 , h , 0 , 1 , 0 , nch ) ;
    if ( ! OIIO::ImageBufAlgo::resample ( sized_buf , read_buf ,
                                          true , roi ) )
    {
      std::cerr << "failed to resample image '" << filename << "': "
                << sized_buf.geterror() << std::endl ;
      return false ;
    }
    p_buf = &sized_buf ;
  }

  std::vector < float > buffer ( std::size_t ( w ) * h * nch ) ;

  bool success
    = p_buf->get_pixels ( OIIO::ROI ( 0 , w , 0 , h , 0 , 1 , 0 , nch ) ,
                          TypeDesc::FLOAT , buffer.data() ) ;

  if ( ! success )
  {
    std::cerr << "failed to fetch pixels from '" << filename << "': "
              << p_buf->geterror() << std::endl ;
    return false ;
  }

  // single-channel (and two-channel grey+alpha) data are replicated
  // to RGB, additional channels beyond the third are ignored.

  const float * p = buffer.data() ;
  for ( long y = 0 ; y < h ; y++ )
  {
    for ( long x = 0 ; x < w ; x++ )
    {
      px_t px ;
      if ( nch >= 3 )
        px = px_t { p[0] , p[1] , p[2] } ;
      else
        px = px_t { p[0] , p[0] , p[0] } ;
      trg [ { x , y } ] = px ;
      p += nch ;
    }
  }
  return true ;
}

// helper function to save a zimt array of pixels to an image file.
// We wrap the pixel data in an OIIO ImageBuf. OIIO uses byte strides,
// so we need to scale up the pixel strides.

bool save_image ( const std::string & filename , image_view_t pixels )
{
  ImageSpec ospec ( pixels.shape[0] , pixels.shape[1] ,
                    3 , TypeDesc::FLOAT ) ;

  ospec["ImageDescription"] = "image produced by viewsynth" ;

  static const size_t px_bytes = sizeof ( px_t ) ;

  OIIO::ImageBuf out_buf ( ospec ,
                           pixels.data() ,
                           pixels.strides[0] * px_bytes ,
                           pixels.strides[1] * px_bytes ) ;

  // formats which can't hold float data get eight bit output

  auto extension = OIIO::Filesystem::extension ( filename ) ;
  if (    extension == ".png" || extension == ".PNG"
       || extension == ".jpg" || extension == ".JPG"
       || extension == ".jpeg" || extension == ".bmp" )
  {
    out_buf.set_write_format ( TypeDesc::UINT8 ) ;
  }

  auto success = out_buf.write ( filename ) ;
  if ( ! success )
  {
    std::cerr << "failed to write image '" << filename << "': "
              << out_buf.geterror() << std::endl ;
  }
  else if ( args.verbose )
  {
    std::cout << "wrote " << filename << std::endl ;
  }
  return success ;
}

} ; // namespace viewsynth
