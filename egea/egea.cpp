
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

#include "egea/egea.h"

#include "egea/phase.h"
#include "egea/force.h"
#include "egea/rigidity.h"
#include "egea/dyncal.h"
#include "egea/criteria.h"

#include "helper/logger.h"
#include "helper/helper.h"
#include "param.h"

#include <future>
#include <functional>

extern logger_t logger;

egea_test_result_t egea::evaluate_wheel( const wheel_input_t & input , const egea_param_t & param )
{

  logger << "  evaluating wheel " << input.wheel_id 
	 << " (" << input.time.size() << " samples, Fst = " << input.static_weight << " N)\n";
  
  phase_shift_analyzer_t phase_analyzer( param );
  force_analyzer_t force_analyzer( param );
  rigidity_calculator_t rigidity_calculator( param );
  criteria_evaluator_t criteria( param );
  
  phase_result_t phase = phase_analyzer.analyze( input.position , input.force , input.time , input.static_weight );

  force_result_t force = force_analyzer.analyze( input.force , input.time , input.static_weight );

  rigidity_result_t rigidity;
  if ( input.h25 ) 
    rigidity = rigidity_calculator.calculate( *input.h25 );
  else if ( input.h25_trace.size() > 0 ) 
    rigidity = rigidity_calculator.calculate( input.h25_trace , input.h25_sample_rate );
  else
    rigidity = rigidity_calculator.estimate( input.force );

  std::optional<dyncal_result_t> dyncal;
  if ( input.platform_force.size() > 0 ) 
    {
      dynamic_calibrator_t calibrator( param );
      dyncal = calibrator.calibrate( input.platform_force , input.time , input.platform_mass );
    }
  
  return criteria.evaluate_wheel( input.wheel_id , input.vehicle_type , phase , force , rigidity , dyncal );
  
}


axle_result_t egea::evaluate_axle( const std::string & axle_id , 
				   const wheel_input_t & left , 
				   const wheel_input_t & right , 
				   const egea_param_t & param )
{
  criteria_evaluator_t criteria( param );
  egea_test_result_t l = evaluate_wheel( left , param );
  egea_test_result_t r = evaluate_wheel( right , param );
  return criteria.evaluate_axle( axle_id , l , r );
}


axle_result_t egea::evaluate_axle_async( const std::string & axle_id , 
					 const wheel_input_t & left , 
					 const wheel_input_t & right , 
					 const egea_param_t & param )
{

  // fail on bad config here, not inside a worker
  criteria_evaluator_t criteria( param );
  
  std::future<egea_test_result_t> fl = std::async( std::launch::async , 
						   evaluate_wheel , std::cref( left ) , std::cref( param ) );
  
  std::future<egea_test_result_t> fr = std::async( std::launch::async , 
						   evaluate_wheel , std::cref( right ) , std::cref( param ) );

  // get() rethrows anything raised on the worker
  egea_test_result_t l = fl.get();
  egea_test_result_t r = fr.get();
  
  return criteria.evaluate_axle( axle_id , l , r );

}


void egea::set_wheel_options( const param_t & param , const std::string & side , wheel_input_t * input )
{

  const std::string sfx = side == "" ? "" : "_" + side;

  if ( side != "" ) 
    {
      if ( param.has( "wheel" ) ) 
	Helper::halt( "use wheel_left and wheel_right for an axle, not wheel" );
      if ( param.has( "h25" ) ) 
	Helper::halt( "use h25_left and h25_right for an axle, not h25" );
    }

  // a simulated sweep already carries its Fst
  if ( param.has( "fst" + sfx ) || input->static_weight <= 0 ) 
    input->static_weight = param.requires_dbl( "fst" + sfx );
  
  if ( param.has( "wheel" + sfx ) ) 
    input->wheel_id = param.value( "wheel" + sfx );
  
  // one vehicle class per axle
  if ( param.has( "vehicle" ) ) 
    {
      if ( ! str2vehicle_type( param.value( "vehicle" ) , &input->vehicle_type ) )
	Helper::halt( "vehicle should be M1 or N1" );
    }

  if ( param.has( "h25" + sfx ) ) 
    input->h25 = param.requires_dbl( "h25" + sfx );

  if ( param.has( "mass" + sfx ) ) 
    input->platform_mass = param.requires_dbl( "mass" + sfx );
  else if ( param.has( "mass" ) ) 
    input->platform_mass = param.requires_dbl( "mass" );
  
}
