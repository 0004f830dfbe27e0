
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

#ifndef __SPECSUS_EGEA_RESULTS_H__
#define __SPECSUS_EGEA_RESULTS_H__

#include <vector>
#include <string>
#include <optional>

#include "egea/egea-param.h"

//
// Plain result records; each is built once by an analyzer and then
// only read
//

// one platform cycle (TOP to TOP)
struct phase_period_t
{
  phase_period_t() 
  : period_index(0) , frequency(0) , phase_shift(0) , fref(0) , top_p(0) ,
    max_force(0) , min_force(0) , delta_force(0) , static_weight(0) , t_start(0) , is_valid(false) 
  { } 
  
  int period_index;
  double frequency;     // Hz
  double phase_shift;   // deg, 0..180
  double fref;          // s, from cycle start
  double top_p;         // s, from cycle start
  double max_force;     // N
  double min_force;     // N
  double delta_force;   // N
  double static_weight; // N
  double t_start;       // s, cycle start in the trace
  bool is_valid;

  // relative force amplitude (% of Fst)
  double rfa() const;
};


// smoothed phase-vs-frequency curve
struct phase_curve_t 
{
  std::vector<double> frq;
  std::vector<double> phase;
};


struct phase_result_t
{
  phase_result_t() : f_under_flag(false) , f_over_flag(false) , static_weight(0) , n_cycles(0) { } 
  
  std::vector<phase_period_t> periods;

  std::optional<double> min_phase_shift;
  std::optional<double> min_phase_frequency;
  std::optional<double> max_phase_shift;
  std::optional<double> rfa_max_value;
  std::optional<double> rfa_max_frequency;

  bool f_under_flag;
  bool f_over_flag;
  double static_weight;

  // cycles examined (before any were dropped)
  int n_cycles;

  phase_curve_t curve;
  
  // diagnostic for rejected input
  std::string error;
  
  bool is_valid() const 
  { 
    return min_phase_shift.has_value() && periods.size() > 0 && ! f_under_flag ; 
  }

  // displayed (truncated) phi_min, if any
  std::optional<int> integer_min_phase() const 
  {
    if ( ! min_phase_shift ) return std::nullopt;
    return (int)(*min_phase_shift);
  }
  
};


struct force_result_t
{
  force_result_t() 
  : fmin(0) , fmax(0) , fa_max(0) , resonant_frequency(0) , rfa_max(0) , static_weight(0) , 
    t_fmin(0) , t_fmax(0) , f_under_flag(false) , f_over_flag(false) { } 
  
  double fmin;
  double fmax;
  double fa_max;
  double resonant_frequency;
  double rfa_max;          // %
  double static_weight;

  // times of the extremes, from trace start
  double t_fmin;
  double t_fmax;
  
  bool f_under_flag;
  bool f_over_flag;

  std::string error;

  bool is_valid() const { return error.empty(); } 
};


struct rigidity_result_t
{
  rigidity_result_t() 
  : rigidity(0) , h25(0) , platform_amplitude(0) , 
    warning_underinflation(false) , warning_overinflation(false) , h25_estimated(false) { } 
  
  double rigidity;            // N/mm
  double h25;                 // N
  double platform_amplitude;  // mm
  bool warning_underinflation;
  bool warning_overinflation;

  // H25 came from 2 x SD(force), not a 25 Hz reference
  bool h25_estimated;
  
  std::string error;
  
  bool is_valid() const { return error.empty(); } 
};


struct dyncal_result_t
{
  dyncal_result_t() : is_valid(false) , platform_mass(0) { } 

  // one entry per in-range cycle
  std::vector<double> max_fp;
  std::vector<double> delta_period;
  std::vector<double> frequencies;

  bool is_valid;
  std::optional<std::string> error_message;

  // kg, reported only
  double platform_mass;
};


enum quality_t
  {
    QUALITY_EXCELLENT ,
    QUALITY_GOOD ,
    QUALITY_ACCEPTABLE ,
    QUALITY_POOR
  };

std::string quality_str( quality_t q );


// one wheel
struct egea_test_result_t
{
  egea_test_result_t() 
  : vehicle_type( VEHICLE_M1 ) , 
    absolute_criterion_pass(false) , relative_criterion_pass(false) , overall_pass(false) ,
    weight_in_range(false) , phase_threshold(0) , quality_index(0) , damping_ratio(0) , quality( QUALITY_POOR ) { } 
  
  std::string wheel_id;
  vehicle_type_t vehicle_type;

  phase_result_t phase;
  force_result_t force;
  rigidity_result_t rigidity;
  std::optional<dyncal_result_t> dyncal;

  bool absolute_criterion_pass;

  // set only once the wheel is evaluated within an axle
  bool relative_criterion_pass;

  bool overall_pass;

  // static weight within [min_weight,max_weight] daN; reported only
  bool weight_in_range;

  // phi_min threshold for this vehicle class
  double phase_threshold;

  // reported, not part of the verdict
  double quality_index;
  double damping_ratio;
  quality_t quality;
  
  std::vector<std::string> errors;
};


struct axle_result_t
{
  axle_result_t() 
  : axle_weight(0) , relative_rfa_max_pass(false) , relative_phi_min_pass(false) , 
    relative_rigidity_pass(false) , overall_pass(false) { } 
  
  std::string axle_id;
  
  egea_test_result_t left_wheel;
  egea_test_result_t right_wheel;

  double axle_weight;  // N

  // imbalances (%), only when both phase results are valid
  std::optional<double> d_rfa_max;
  std::optional<double> d_phi_min;
  std::optional<double> d_i_phi_min;
  std::optional<double> d_rigidity;

  bool relative_rfa_max_pass;
  bool relative_phi_min_pass;
  bool relative_rigidity_pass;

  bool overall_pass;
};

#endif
