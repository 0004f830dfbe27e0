
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

#ifndef __SPECSUS_EGEA_CRITERIA_H__
#define __SPECSUS_EGEA_CRITERIA_H__

#include <string>
#include <optional>

#include "egea/egea-param.h"
#include "egea/results.h"

//
// Absolute (per wheel) and relative (left/right) EGEA criteria
//

struct criteria_evaluator_t
{

  explicit criteria_evaluator_t( const egea_param_t & param );

  // phi_min >= class threshold
  bool absolute_criterion( const phase_result_t & phase , vehicle_type_t vt ) const;
  
  egea_test_result_t evaluate_wheel( const std::string & wheel_id , 
				     vehicle_type_t vt , 
				     const phase_result_t & phase , 
				     const force_result_t & force , 
				     const rigidity_result_t & rigidity , 
				     const std::optional<dyncal_result_t> & dyncal = std::nullopt ) const;
  
  axle_result_t evaluate_axle( const std::string & axle_id , 
			       const egea_test_result_t & left , 
			       const egea_test_result_t & right ) const;
  
 private:

  const egea_param_t param;
  
};


namespace egea 
{ 

  // |v1 - v2| / max(v1,v2) * 100, or 0 if both are 0
  double imbalance( double v1 , double v2 );

  // from phi_min relative to the class threshold
  quality_t quality_rating( double phi_min , double threshold );

}

#endif
