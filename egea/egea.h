
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

#ifndef __SPECSUS_EGEA_H__
#define __SPECSUS_EGEA_H__

#include <vector>
#include <string>
#include <optional>

#include "egea/egea-param.h"
#include "egea/results.h"

struct param_t;

//
// One wheel's worth of rig data
//

struct wheel_input_t
{

  wheel_input_t() 
  : vehicle_type( VEHICLE_M1 ) , static_weight(0) , h25_sample_rate(0) , platform_mass(0) { } 
  
  std::string wheel_id;
  vehicle_type_t vehicle_type;
  
  std::vector<double> time;
  std::vector<double> position;
  std::vector<double> force;
  double static_weight;

  // H25 is taken from (in order): 'h25', a 25 Hz reference trace, or
  // estimated from 'force'
  std::optional<double> h25;
  std::vector<double> h25_trace;
  double h25_sample_rate;

  // optional unloaded-platform trace (same time base)
  std::vector<double> platform_force;
  double platform_mass;
  
};


namespace egea 
{ 

  // wheel-level settings from params; side is "" for a single wheel, or
  // "left"/"right" within an axle, where fst_left, h25_left, wheel_left etc
  // are read and the unsuffixed wheel= and h25= are refused
  void set_wheel_options( const param_t & param , const std::string & side , wheel_input_t * input );

  // phase, force, rigidity (and dynamic calibration, if a platform trace is
  // given) followed by the absolute criterion
  egea_test_result_t evaluate_wheel( const wheel_input_t & input , const egea_param_t & param );

  // both wheels, then the relative criteria
  axle_result_t evaluate_axle( const std::string & axle_id , 
			       const wheel_input_t & left , 
			       const wheel_input_t & right , 
			       const egea_param_t & param );

  // as above, left and right evaluated on separate threads
  axle_result_t evaluate_axle_async( const std::string & axle_id , 
				     const wheel_input_t & left , 
				     const wheel_input_t & right , 
				     const egea_param_t & param );

}

#endif
