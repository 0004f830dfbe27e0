
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

#ifndef __SPECSUS_MISCMATH_H__
#define __SPECSUS_MISCMATH_H__

#include <vector>
#include <cstddef>
#include <complex>
#include <algorithm>

namespace MiscMath
{
  
  // next pow2
  long int nextpow2( const int a );

  // mean/variance  
  double mean( const std::vector<double> & x );
  double variance( const std::vector<double> & x );
  double variance( const std::vector<double> & x , double m );
  double sdev( const std::vector<double> & x );
  double sdev( const std::vector<double> & x , double m );
  
  // extremes
  double max( const std::vector<double> & x );
  double min( const std::vector<double> & x );
  void minmax( const std::vector<double> & x , double * mn , double * mx );

  // index of first maximum/minimum (-1 if empty)
  int argmax( const std::vector<double> & x );
  int argmin( const std::vector<double> & x );
  
  // piecewise linear interpolation of (x,y), x ascending, with linear
  // extrapolation beyond either end
  std::vector<double> interpolate( const std::vector<double> & x ,
				   const std::vector<double> & y ,
				   const std::vector<double> & xi );
  
  // Gaussian kernel smoother (sigma in samples), edge values held 
  std::vector<double> gaussian_smooth( const std::vector<double> & x , double sigma );
  
  template<typename T> static inline double Lerp(T v0, T v1, T t)
   {
     return (1 - t)*v0 + t*v1;
   }
  
}

#endif
