
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

#ifndef __SPECSUS_EGEA_PHASE_H__
#define __SPECSUS_EGEA_PHASE_H__

#include <vector>

#include "egea/egea-param.h"
#include "egea/results.h"

//
// Phase shift between platform TOP and the tire force, per platform cycle,
// and phi_min over the sweep
//

struct phase_shift_analyzer_t
{
  
  explicit phase_shift_analyzer_t( const egea_param_t & param );
  
  phase_result_t analyze( const std::vector<double> & position , 
			  const std::vector<double> & force , 
			  const std::vector<double> & time , 
			  double static_weight ) const;

 private:

  // phase for cycle [s,e]; false if the cycle is dropped
  bool analyze_cycle( const std::vector<double> & position , 
		      const std::vector<double> & force , 
		      const std::vector<double> & time , 
		      double static_weight , 
		      double sample_rate , 
		      int s , int e , 
		      phase_period_t * period ) const;
  
  void aggregate( phase_result_t * res ) const;
  
  const egea_param_t param;
  
};


namespace egea 
{ 
  // valid periods resampled onto a curve_step grid and Gaussian-smoothed
  phase_curve_t phase_curve( const std::vector<phase_period_t> & periods , 
			     const egea_param_t & param );
}

#endif
