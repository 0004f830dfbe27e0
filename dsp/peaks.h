
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

#ifndef __SPECSUS_PEAKS_H__
#define __SPECSUS_PEAKS_H__

#include <vector>
  
struct peaks_t {
  
 peaks_t()
  {
    // option defaults
    max = true;
    min = false;    
    th_clipped = 3; // 3 or more equal sample points at the extreme == 'clipped'
    distance = 0;   // minimum separation (samples) between retained peaks
    prominence = 0; // minimum prominence of retained peaks
  }

  // find peaks; results in pk/values/ismin, in ascending sample order
  void detect( const std::vector<double> * x );
  
  // find max and/or min
  bool max;
  bool min;
  
  // number of contiguous samples to call something clipped (0 = no check)
  int th_clipped;  

  // to testing clipping
  const double EPS = 1e-6;

  double distance;
  double prominence;

  // peak locations/values
  std::vector<int> pk;
  std::vector<double> values;
  std::vector<bool> ismin;

  // prominence of each retained peak
  std::vector<double> prominences;
  
 private:

  void select_by_distance( const std::vector<double> * x );

  void select_by_prominence( const std::vector<double> * x );

  double peak_prominence( const std::vector<double> * x , int p , bool is_min ) const;
  
};

#endif
