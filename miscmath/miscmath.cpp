
//    --------------------------------------------------------------------
//
//    This file is part of specsus.
//
//    specsus is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    specsus is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with specsus. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "miscmath.h"
#include "helper/helper.h"

#include <cmath>

long int MiscMath::nextpow2( const int a )
{
  // for now, just go up to 2^31
  for (int i=1;i<32;i++)
    {
      long int t = pow(2,i);
      if ( a <= t ) return t;
    }
  Helper::halt("value too large in nextpow2()");
  return 0;
}

//
// Mean, variance
//

double MiscMath::mean( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n == 0 ) return 0; // silently fail here
  double s = 0;
  for (int i=0;i<n;i++) s += x[i];
  return s/(double)n;
}

double MiscMath::variance( const std::vector<double> & x )
{
  return variance( x , mean(x) );
}

double MiscMath::variance( const std::vector<double> & x , double m )
{
  const int n = x.size();
  if ( n < 2 ) return 0;
  double ss = 0;
  for (int i=0;i<n;i++)
    {
      const double t = x[i] - m;
      ss += t*t;      
    }
  return ss/(double)(n-1);
}

double MiscMath::sdev( const std::vector<double> & x )
{
  return sqrt( variance(x) );
}

double MiscMath::sdev( const std::vector<double> & x , double m )
{
  return sqrt( variance( x , m ) );
}

//
// Extremes
//

double MiscMath::max(const std::vector<double> & x )
{
  double mn, mx;
  minmax( x , &mn , &mx );
  return mx;
}

double MiscMath::min(const std::vector<double> & x )
{
  double mn, mx;
  minmax( x , &mn , &mx );
  return mn;
}

void MiscMath::minmax( const std::vector<double> & x , double * mn , double * mx)
{

  const int n = x.size();

  if ( n == 0 ) 
    {
      *mn = *mx = 0;
      return;
    }
  
  *mn = *mx = x[0];
  for (int i=1;i<n;i++)
    {
      if      ( x[i] < *mn ) *mn = x[i];
      else if ( x[i] > *mx ) *mx = x[i]; 
    }
  
}

int MiscMath::argmax( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n == 0 ) return -1;
  int mi = 0;
  for (int i=1;i<n;i++)
    if ( x[i] > x[mi] ) mi = i;
  return mi;
}

int MiscMath::argmin( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n == 0 ) return -1;
  int mi = 0;
  for (int i=1;i<n;i++)
    if ( x[i] < x[mi] ) mi = i;
  return mi;
}

//
// Interpolation / smoothing
//

std::vector<double> MiscMath::interpolate( const std::vector<double> & x ,
					   const std::vector<double> & y ,
					   const std::vector<double> & xi )
{
  const int n = x.size();
  if ( n != y.size() ) Helper::halt( "interpolate(): x and y of different length" );

  std::vector<double> yi( xi.size() );

  if ( n == 0 ) return yi;

  if ( n == 1 )
    {
      for (int i=0;i<xi.size();i++) yi[i] = y[0];
      return yi;
    }
  
  for (int i=0;i<xi.size();i++)
    {
      // segment [j,j+1] bracketing xi, clamped to the end segments
      // so points outside the range are extrapolated
      int j = std::upper_bound( x.begin() , x.end() , xi[i] ) - x.begin() - 1;
      if ( j < 0 ) j = 0;
      if ( j > n - 2 ) j = n - 2;

      const double dx = x[j+1] - x[j];
      if ( dx == 0 ) { yi[i] = y[j]; continue; }
      
      const double t = ( xi[i] - x[j] ) / dx;
      yi[i] = Lerp( y[j] , y[j+1] , t );
    }
  
  return yi;
}


std::vector<double> MiscMath::gaussian_smooth( const std::vector<double> & x , double sigma )
{
  const int n = x.size();
  if ( n == 0 || sigma <= 0 ) return x;

  // kernel truncated at 4 SD
  const int hw = (int)ceil( 4 * sigma );
  std::vector<double> k( 2*hw + 1 );
  double ksum = 0;
  for (int i=-hw;i<=hw;i++)
    {
      k[i+hw] = exp( - ( i * i ) / ( 2.0 * sigma * sigma ) );
      ksum += k[i+hw];
    }
  for (int i=0;i<k.size();i++) k[i] /= ksum;
  
  std::vector<double> r( n );
  for (int i=0;i<n;i++)
    {
      double s = 0;
      for (int j=-hw;j<=hw;j++)
	{
	  int p = i + j;
	  if ( p < 0 ) p = 0;
	  else if ( p >= n ) p = n - 1;
	  s += k[j+hw] * x[p];
	}
      r[i] = s;
    }

  return r;
}
