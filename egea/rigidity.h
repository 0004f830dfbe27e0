
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

#ifndef __SPECSUS_EGEA_RIGIDITY_H__
#define __SPECSUS_EGEA_RIGIDITY_H__

#include <vector>

#include "egea/egea-param.h"
#include "egea/results.h"

//
// Tire rigidity from the force amplitude at the 25 Hz reference:
//   rig = A_RIG * ( H25 / ep ) + B_RIG
//

struct rigidity_calculator_t
{

  explicit rigidity_calculator_t( const egea_param_t & param );

  // H25 supplied by the caller
  rigidity_result_t calculate( double h25 ) const;

  // H25 measured from a 25 Hz calibration trace
  rigidity_result_t calculate( const std::vector<double> & reference , double sample_rate ) const;
  
  // no reference available: H25 ~ 2 * SD( force ), flagged as estimated
  rigidity_result_t estimate( const std::vector<double> & force ) const;

 private:

  const egea_param_t param;

};


namespace egea 
{ 
  // amplitude of the component of 'x' near 'frq' (Hann-windowed FFT peak)
  double amplitude_at( const std::vector<double> & x , double sample_rate , double frq );
}

#endif
