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

// fitting of planar transformations between two sets of corresponding
// 2D points. With three correspondences we fit an affine transform,
// with four or more a homography (normalized DLT). The result is a
// 3x3 matrix in row-major order, which the warp engine applies to
// homogeneous pixel coordinates.
// The fit is done with Eigen, in double precision. The coefficients
// are handed on as float, because that's what the SIMD code uses.

#ifndef VIEWSYNTH_HOMOGRAPHY_H
#define VIEWSYNTH_HOMOGRAPHY_H

#include <vector>

#include "common.h"

namespace viewsynth
{

struct plane_transform_t
{
  float h [ 9 ] = { 1.0f , 0.0f , 0.0f ,
                    0.0f , 1.0f , 0.0f ,
                    0.0f , 0.0f , 1.0f } ;

  // set if the transform is the identity fallback, not a fit

  bool identity = true ;

  void set_identity() ;

  // apply the transform to a single point

  v2_t apply ( const v2_t & p ) const ;
} ;

// fit a transform mapping 'from' to 'to'. Returns false if there are
// fewer than three points, if the point sets differ in size, or if
// the correspondences are degenerate (e.g. near-collinear points) -
// then 'tf' is set to the identity.

bool fit_plane_transform ( const std::vector < v2_t > & from ,
                           const std::vector < v2_t > & to ,
                           plane_transform_t & tf ) ;

// the smallest triangle area (relative to the point set's squared
// extent) we accept in a fit. Smaller triangles count as collinear.

const double min_relative_area = 1e-6 ;

} ; // namespace viewsynth

#endif // VIEWSYNTH_HOMOGRAPHY_H
