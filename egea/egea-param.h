
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

#ifndef __SPECSUS_EGEA_PARAM_H__
#define __SPECSUS_EGEA_PARAM_H__

#include <string>
#include <optional>

struct param_t;

// EGEA vehicle classes: passenger cars, light commercial vehicles
enum vehicle_type_t
  {
    VEHICLE_M1 ,
    VEHICLE_N1
  };

std::string vehicle_type_str( vehicle_type_t t );

// M1/N1 (case-insensitive); false if not recognized
bool str2vehicle_type( const std::string & s , vehicle_type_t * t );


//
// Immutable configuration snapshot for one test run; defaults are the
// SPECSUS2018 constants
//

struct egea_param_t
{

  egea_param_t();

  // defaults, overridden by any same-named key; validated
  explicit egea_param_t( const param_t & param );

  // halts (i.e. throws) on any inconsistent setting
  void validate() const;
  
  double phase_shift_min( vehicle_type_t t ) const;

  // underflow limit for a given static weight (N)
  double f_under_lim( double static_weight ) const;

  // wheel weight (daN) inside [min_weight,max_weight]?
  bool validate_wheel_weight( double weight_daN ) const;

  std::string dump() const;
  
  // analysis window (Hz)
  double min_calc_freq;
  double max_calc_freq;
  
  // absolute criterion (deg)
  double phase_shift_min_m1;
  double phase_shift_min_n1;
  double phase_shift_max;

  // RFst guard: percent of the cycle force range kept clear of either extreme
  double rfst_fmin_pct;
  double rfst_fmax_pct;

  // per-cycle phase filter: passband / stopband as multiples of the
  // cycle frequency, and ripple
  double pass_mul_ph;
  double stop_mul_ph;
  double eps_ph;
  
  // whole-trace amplitude filter (Hz)
  double amp_pass_hz;
  double amp_stop_hz;
  double eps_amp;

  // saturation limits
  double f_under_lim_pct;
  std::optional<double> f_over_lim;

  // tire rigidity
  double platform_amplitude; // ep (mm)
  double a_rig;
  double b_rig;
  double rig_lo_lim;
  double rig_hi_lim;
  
  // dynamic calibration budget, N per Hz
  double dyn_cal_err;

  // relative (left/right) criteria, percent
  double rfa_max_imbalance;
  double phi_min_imbalance;
  double rig_imbalance;
  
  // misc. rig constants
  double min_weight;         // daN
  double max_weight;         // daN

  // input validation
  int min_samples;
  double min_sample_rate;
  double max_sample_rate;

  // max_phase_shift is taken from a period within this distance of max_calc_freq
  double phase_near_18_tol;

  // phase curve 
  double curve_step;
  int smooth_order;

  // log each dropped cycle
  bool verbose;
  
};

#endif
