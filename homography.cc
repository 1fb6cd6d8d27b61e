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

// implementation of the planar transform fit. The homography is
// computed with the normalized direct linear transform: both point
// sets are shifted to their centroid and scaled to a mean distance
// of sqrt(2), the DLT system is solved by SVD and the normalization
// is undone afterwards.

#include <Eigen/Dense>

#include "homography.h"

namespace viewsynth
{

void plane_transform_t::set_identity()
{
  for ( int i = 0 ; i < 9 ; i++ )
    h [ i ] = ( i % 4 == 0 ) ? 1.0f : 0.0f ;
  identity = true ;
}

v2_t plane_transform_t::apply ( const v2_t & p ) const
{
  float x = h[0] * p[0] + h[1] * p[1] + h[2] ;
  float y = h[3] * p[0] + h[4] * p[1] + h[5] ;
  float w = h[6] * p[0] + h[7] * p[1] + h[8] ;
  return v2_t { x / w , y / w } ;
}

namespace
{

// similarity transform which moves the points' centroid to the origin
// and scales them to a mean distance of sqrt(2) from it

Eigen::Matrix3d normalizer ( const std::vector < v2_t > & pts )
{
  double cx = 0.0 , cy = 0.0 ;
  for ( const auto & p : pts )
  {
    cx += p[0] ;
    cy += p[1] ;
  }
  cx /= pts.size() ;
  cy /= pts.size() ;

  double mean_dist = 0.0 ;
  for ( const auto & p : pts )
    mean_dist += std::hypot ( p[0] - cx , p[1] - cy ) ;
  mean_dist /= pts.size() ;

  double s = ( mean_dist > 0.0 ) ? std::sqrt ( 2.0 ) / mean_dist : 1.0 ;

  Eigen::Matrix3d t ;
  t << s   , 0.0 , - s * cx ,
       0.0 , s   , - s * cy ,
       0.0 , 0.0 , 1.0 ;
  return t ;
}

// test for near-collinear points: every triangle formed by three
// consecutive points (cyclically) must have a reasonable area
// relative to the square of the point set's extent.

bool degenerate ( const std::vector < v2_t > & pts )
{
  std::size_t n = pts.size() ;

  double x0 = pts[0][0] , x1 = x0 , y0 = pts[0][1] , y1 = y0 ;
  for ( const auto & p : pts )
  {
    x0 = std::min ( x0 , double ( p[0] ) ) ;
    x1 = std::max ( x1 , double ( p[0] ) ) ;
    y0 = std::min ( y0 , double ( p[1] ) ) ;
    y1 = std::max ( y1 , double ( p[1] ) ) ;
  }
  double extent = std::max ( x1 - x0 , y1 - y0 ) ;
  if ( extent <= 0.0 )
    return true ;

  std::size_t ntri = ( n == 3 ) ? 1 : n ;
  for ( std::size_t i = 0 ; i < ntri ; i++ )
  {
    const v2_t & a ( pts [ i ] ) ;
    const v2_t & b ( pts [ ( i + 1 ) % n ] ) ;
    const v2_t & c ( pts [ ( i + 2 ) % n ] ) ;
    double area = 0.5 * std::abs (   ( double ( b[0] ) - a[0] ) * ( c[1] - a[1] )
                                   - ( double ( c[0] ) - a[0] ) * ( b[1] - a[1] ) ) ;
    if ( area < min_relative_area * extent * extent )
      return true ;
  }
  return false ;
}

bool fit_affine ( const std::vector < v2_t > & from ,
                  const std::vector < v2_t > & to ,
                  Eigen::Matrix3d & m )
{
  Eigen::Matrix < double , 6 , 6 > a ;
  Eigen::Matrix < double , 6 , 1 > b ;
  a.setZero() ;

  for ( int i = 0 ; i < 3 ; i++ )
  {
    double x = from[i][0] , y = from[i][1] ;
    a.row ( 2 * i )     << x , y , 1.0 , 0.0 , 0.0 , 0.0 ;
    a.row ( 2 * i + 1 ) << 0.0 , 0.0 , 0.0 , x , y , 1.0 ;
    b ( 2 * i ) = to[i][0] ;
    b ( 2 * i + 1 ) = to[i][1] ;
  }

  Eigen::FullPivLU < Eigen::Matrix < double , 6 , 6 > > lu ( a ) ;
  if ( lu.rank() < 6 )
    return false ;

  Eigen::Matrix < double , 6 , 1 > p = lu.solve ( b ) ;

  m << p(0) , p(1) , p(2) ,
       p(3) , p(4) , p(5) ,
       0.0  , 0.0  , 1.0 ;
  return true ;
}

bool fit_homography ( const std::vector < v2_t > & from ,
                      const std::vector < v2_t > & to ,
                      Eigen::Matrix3d & m )
{
  Eigen::Matrix3d t_from = normalizer ( from ) ;
  Eigen::Matrix3d t_to = normalizer ( to ) ;

  std::ptrdiff_t n = from.size() ;
  Eigen::MatrixXd a ( 2 * n , 9 ) ;

  for ( std::ptrdiff_t i = 0 ; i < n ; i++ )
  {
    Eigen::Vector3d p = t_from * Eigen::Vector3d ( from[i][0] , from[i][1] , 1.0 ) ;
    Eigen::Vector3d q = t_to * Eigen::Vector3d ( to[i][0] , to[i][1] , 1.0 ) ;
    double x = p(0) , y = p(1) , u = q(0) , v = q(1) ;

    a.row ( 2 * i )     << - x , - y , -1.0 , 0.0 , 0.0 , 0.0 , u * x , u * y , u ;
    a.row ( 2 * i + 1 ) << 0.0 , 0.0 , 0.0 , - x , - y , -1.0 , v * x , v * y , v ;
  }

  // with exactly four points, A is 8x9 - we need the full V to get
  // at the null space vector.

  Eigen::JacobiSVD < Eigen::MatrixXd > svd ( a , Eigen::ComputeFullV ) ;

  // a second (near-)null singular value means the system is
  // underdetermined: the correspondences don't fix a homography.

  auto sv = svd.singularValues() ;
  if ( sv.size() >= 8 && sv ( 7 ) < 1e-9 * sv ( 0 ) )
    return false ;

  Eigen::VectorXd h = svd.matrixV().col ( 8 ) ;

  Eigen::Matrix3d hn ;
  hn << h(0) , h(1) , h(2) ,
        h(3) , h(4) , h(5) ,
        h(6) , h(7) , h(8) ;

  m = t_to.inverse() * hn * t_from ;

  if ( std::abs ( m ( 2 , 2 ) ) < 1e-12 )
    return false ;

  double scale = m ( 2 , 2 ) ;
  m /= scale ;
  return m.allFinite() ;
}

} ; // anonymous namespace

bool fit_plane_transform ( const std::vector < v2_t > & from ,
                           const std::vector < v2_t > & to ,
                           plane_transform_t & tf )
{
  tf.set_identity() ;

  if ( from.size() != to.size() || from.size() < 3 )
    return false ;

  if ( degenerate ( from ) || degenerate ( to ) )
    return false ;

  Eigen::Matrix3d m ;
  bool success ;

  if ( from.size() == 3 )
    success = fit_affine ( from , to , m ) ;
  else
    success = fit_homography ( from , to , m ) ;

  if ( ! success )
    return false ;

  for ( int r = 0 ; r < 3 ; r++ )
  {
    for ( int c = 0 ; c < 3 ; c++ )
      tf.h [ 3 * r + c ] = float ( m ( r , c ) ) ;
  }
  tf.identity = false ;
  return true ;
}

} ; // namespace viewsynth
