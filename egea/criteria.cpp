
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

#include "egea/criteria.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>
#include <sstream>

extern logger_t logger;

criteria_evaluator_t::criteria_evaluator_t( const egea_param_t & p )
  : param( p )
{
  param.validate();
}


double egea::imbalance( double v1 , double v2 )
{
  const double mx = v1 > v2 ? v1 : v2;
  if ( mx == 0 ) return 0;
  return fabs( v1 - v2 ) / mx * 100.0;
}


quality_t egea::quality_rating( double phi_min , double threshold )
{
  if ( threshold <= 0 ) return QUALITY_EXCELLENT;
  const double r = phi_min / threshold;
  if ( r >= 1.5 ) return QUALITY_EXCELLENT;
  if ( r >= 1.2 ) return QUALITY_GOOD;
  if ( r >= 1.0 ) return QUALITY_ACCEPTABLE;
  return QUALITY_POOR;
}


bool criteria_evaluator_t::absolute_criterion( const phase_result_t & phase , vehicle_type_t vt ) const
{
  if ( ! phase.min_phase_shift ) return false;
  return *phase.min_phase_shift >= param.phase_shift_min( vt );
}


egea_test_result_t criteria_evaluator_t::evaluate_wheel( const std::string & wheel_id , 
							 vehicle_type_t vt , 
							 const phase_result_t & phase , 
							 const force_result_t & force , 
							 const rigidity_result_t & rigidity , 
							 const std::optional<dyncal_result_t> & dyncal ) const
{
  
  egea_test_result_t res;
  res.wheel_id = wheel_id;
  res.vehicle_type = vt;
  res.phase = phase;
  res.force = force;
  res.rigidity = rigidity;
  res.dyncal = dyncal;

  res.phase_threshold = param.phase_shift_min( vt );
  
  //
  // Diagnostics
  //

  if ( phase.error != "" ) res.errors.push_back( "phase shift: " + phase.error );
  else if ( ! phase.min_phase_shift ) res.errors.push_back( "phase shift: no valid cycles" );
  if ( phase.f_under_flag ) res.errors.push_back( "force underflow" );
  if ( phase.f_over_flag ) res.errors.push_back( "force overflow" );
  if ( force.error != "" ) res.errors.push_back( "force: " + force.error );
  if ( rigidity.error != "" ) res.errors.push_back( "rigidity: " + rigidity.error );
  if ( dyncal && ! dyncal->is_valid ) 
    res.errors.push_back( "dynamic calibration: " + ( dyncal->error_message ? *dyncal->error_message : std::string( "invalid" ) ) );

  // Fst in N, limits in daN
  res.weight_in_range = param.validate_wheel_weight( phase.static_weight / 10.0 );
  if ( ! res.weight_in_range ) 
    Helper::warn( "wheel " + wheel_id + ": static weight " + Helper::dbl2str( phase.static_weight / 10.0 ) 
		  + " daN outside " + Helper::dbl2str( param.min_weight ) + " - " 
		  + Helper::dbl2str( param.max_weight ) + " daN" );
  
  //
  // Verdict
  //
  
  res.absolute_criterion_pass = absolute_criterion( phase , vt );

  res.overall_pass = res.absolute_criterion_pass 
    && ! ( phase.f_under_flag || phase.f_over_flag ) 
    && phase.is_valid();
  
  //
  // Reported quality 
  //

  if ( phase.min_phase_shift ) 
    {
      const double phi = *phase.min_phase_shift;
      
      res.quality_index = res.phase_threshold > 0 ? phi / res.phase_threshold * 100.0 : 100.0;
      if ( res.quality_index > 100.0 ) res.quality_index = 100.0;
      
      res.damping_ratio = sin( phi * M_PI / 180.0 ) / 2.0;

      res.quality = egea::quality_rating( phi , res.phase_threshold );
    }

  std::stringstream ss;
  ss << "  wheel " << wheel_id << " (" << vehicle_type_str( vt ) << "): "
     << ( res.overall_pass ? "PASS" : "FAIL" ) ;
  if ( phase.min_phase_shift ) 
    ss << ", phi_min " << Helper::dbl2str( *phase.min_phase_shift , 1 ) 
       << " (threshold " << res.phase_threshold << ")";
  ss << "\n";
  logger << ss.str();
  
  return res;
}


axle_result_t criteria_evaluator_t::evaluate_axle( const std::string & axle_id , 
						   const egea_test_result_t & left , 
						   const egea_test_result_t & right ) const
{
  
  axle_result_t res;
  res.axle_id = axle_id;
  res.left_wheel = left;
  res.right_wheel = right;
  
  res.axle_weight = left.phase.static_weight + right.phase.static_weight;

  if ( left.phase.is_valid() && right.phase.is_valid() )
    {

      res.d_rfa_max = egea::imbalance( left.force.rfa_max , right.force.rfa_max );

      // is_valid() implies phi_min is present
      res.d_phi_min = egea::imbalance( *left.phase.min_phase_shift , *right.phase.min_phase_shift );
      
      res.d_i_phi_min = egea::imbalance( *left.phase.integer_min_phase() , *right.phase.integer_min_phase() );
      
      res.d_rigidity = egea::imbalance( left.rigidity.rigidity , right.rigidity.rigidity );

      res.relative_rfa_max_pass = *res.d_rfa_max <= param.rfa_max_imbalance;
      res.relative_phi_min_pass = *res.d_phi_min <= param.phi_min_imbalance;
      res.relative_rigidity_pass = *res.d_rigidity <= param.rig_imbalance;
    }

  const bool relative = res.relative_rfa_max_pass && res.relative_phi_min_pass && res.relative_rigidity_pass;

  res.left_wheel.relative_criterion_pass = relative;
  res.right_wheel.relative_criterion_pass = relative;
  
  res.overall_pass = left.overall_pass && right.overall_pass && relative;

  std::stringstream ss;
  ss << "  axle " << axle_id << ": " << ( res.overall_pass ? "PASS" : "FAIL" );
  if ( res.d_phi_min ) 
    ss << ", D(RFAmax) " << Helper::dbl2str( *res.d_rfa_max , 1 ) 
       << "%, D(phi_min) " << Helper::dbl2str( *res.d_phi_min , 1 ) 
       << "%, D(rig) " << Helper::dbl2str( *res.d_rigidity , 1 ) << "%";
  else
    ss << ", imbalance not computed";
  ss << "\n";
  logger << ss.str();
  
  return res;
}
