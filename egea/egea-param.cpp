
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

#include "egea/egea-param.h"

#include "param.h"
#include "helper/helper.h"

#include <sstream>

std::string vehicle_type_str( vehicle_type_t t )
{
  switch ( t )
    {
    case VEHICLE_M1 : return "M1";
    case VEHICLE_N1 : return "N1";
    }
  return "?";
}

bool str2vehicle_type( const std::string & s , vehicle_type_t * t )
{
  if ( Helper::iequals( s , "M1" ) ) { *t = VEHICLE_M1; return true; }
  if ( Helper::iequals( s , "N1" ) ) { *t = VEHICLE_N1; return true; }
  return false;
}


egea_param_t::egea_param_t()
{
  min_calc_freq = 6.0;
  max_calc_freq = 18.0;

  phase_shift_min_m1 = 35.0;
  phase_shift_min_n1 = 30.0;
  phase_shift_max = 180.0;
  
  rfst_fmin_pct = 25.0;
  rfst_fmax_pct = 25.0;

  pass_mul_ph = 2.0;
  stop_mul_ph = 4.0;
  eps_ph = 0.01;

  amp_pass_hz = 50.0;
  amp_stop_hz = 130.0;
  eps_amp = 0.01;

  f_under_lim_pct = 1.0;
  
  platform_amplitude = 3.0;
  a_rig = 0.571;
  b_rig = 46.0;
  rig_lo_lim = 160.0;
  rig_hi_lim = 400.0;

  dyn_cal_err = 4.0;

  rfa_max_imbalance = 30.0;
  phi_min_imbalance = 30.0;
  rig_imbalance = 35.0;

  min_weight = 100.0;
  max_weight = 1100.0;

  min_samples = 100;
  min_sample_rate = 50.0;
  max_sample_rate = 2000.0;
  
  phase_near_18_tol = 0.5;

  curve_step = 0.1;
  smooth_order = 20;

  verbose = false;
}


egea_param_t::egea_param_t( const param_t & param )
  : egea_param_t()
{

  if ( param.has( "min_calc_freq" ) ) min_calc_freq = param.requires_dbl( "min_calc_freq" );
  if ( param.has( "max_calc_freq" ) ) max_calc_freq = param.requires_dbl( "max_calc_freq" );

  if ( param.has( "phase_shift_min_m1" ) ) phase_shift_min_m1 = param.requires_dbl( "phase_shift_min_m1" );
  if ( param.has( "phase_shift_min_n1" ) ) phase_shift_min_n1 = param.requires_dbl( "phase_shift_min_n1" );
  if ( param.has( "phase_shift_max" ) ) phase_shift_max = param.requires_dbl( "phase_shift_max" );

  if ( param.has( "rfst_fmin_pct" ) ) rfst_fmin_pct = param.requires_dbl( "rfst_fmin_pct" );
  if ( param.has( "rfst_fmax_pct" ) ) rfst_fmax_pct = param.requires_dbl( "rfst_fmax_pct" );
  
  if ( param.has( "pass_mul_ph" ) ) pass_mul_ph = param.requires_dbl( "pass_mul_ph" );
  if ( param.has( "stop_mul_ph" ) ) stop_mul_ph = param.requires_dbl( "stop_mul_ph" );
  if ( param.has( "eps_ph" ) ) eps_ph = param.requires_dbl( "eps_ph" );

  if ( param.has( "amp_pass_hz" ) ) amp_pass_hz = param.requires_dbl( "amp_pass_hz" );
  if ( param.has( "amp_stop_hz" ) ) amp_stop_hz = param.requires_dbl( "amp_stop_hz" );
  if ( param.has( "eps_amp" ) ) eps_amp = param.requires_dbl( "eps_amp" );

  if ( param.has( "f_under_lim_pct" ) ) f_under_lim_pct = param.requires_dbl( "f_under_lim_pct" );
  if ( param.has( "f_over_lim" ) ) f_over_lim = param.requires_dbl( "f_over_lim" );

  if ( param.has( "platform_amplitude" ) ) platform_amplitude = param.requires_dbl( "platform_amplitude" );
  if ( param.has( "a_rig" ) ) a_rig = param.requires_dbl( "a_rig" );
  if ( param.has( "b_rig" ) ) b_rig = param.requires_dbl( "b_rig" );
  if ( param.has( "rig_lo_lim" ) ) rig_lo_lim = param.requires_dbl( "rig_lo_lim" );
  if ( param.has( "rig_hi_lim" ) ) rig_hi_lim = param.requires_dbl( "rig_hi_lim" );

  if ( param.has( "dyn_cal_err" ) ) dyn_cal_err = param.requires_dbl( "dyn_cal_err" );

  if ( param.has( "rfa_max_imbalance" ) ) rfa_max_imbalance = param.requires_dbl( "rfa_max_imbalance" );
  if ( param.has( "phi_min_imbalance" ) ) phi_min_imbalance = param.requires_dbl( "phi_min_imbalance" );
  if ( param.has( "rig_imbalance" ) ) rig_imbalance = param.requires_dbl( "rig_imbalance" );

  if ( param.has( "min_weight" ) ) min_weight = param.requires_dbl( "min_weight" );
  if ( param.has( "max_weight" ) ) max_weight = param.requires_dbl( "max_weight" );

  if ( param.has( "min_samples" ) ) min_samples = param.requires_int( "min_samples" );
  if ( param.has( "min_sample_rate" ) ) min_sample_rate = param.requires_dbl( "min_sample_rate" );
  if ( param.has( "max_sample_rate" ) ) max_sample_rate = param.requires_dbl( "max_sample_rate" );

  if ( param.has( "phase_near_18_tol" ) ) phase_near_18_tol = param.requires_dbl( "phase_near_18_tol" );
  if ( param.has( "curve_step" ) ) curve_step = param.requires_dbl( "curve_step" );
  if ( param.has( "smooth_order" ) ) smooth_order = param.requires_int( "smooth_order" );

  verbose = param.yesno( "verbose" );
  
  validate();
}


void egea_param_t::validate() const
{

  if ( min_calc_freq <= 0 ) 
    Helper::halt( "min_calc_freq must be positive" );
  
  if ( min_calc_freq >= max_calc_freq )
    Helper::halt( "min_calc_freq (" + Helper::dbl2str( min_calc_freq ) 
		  + ") must be below max_calc_freq (" + Helper::dbl2str( max_calc_freq ) + ")" );
  
  if ( phase_shift_min_m1 < 0 || phase_shift_min_n1 < 0 ) 
    Helper::halt( "phase_shift_min thresholds must be non-negative" );

  if ( phase_shift_max <= 0 || phase_shift_max > 180 ) 
    Helper::halt( "phase_shift_max must be in (0,180]" );
  
  if ( rfst_fmin_pct < 0 || rfst_fmin_pct >= 50 || rfst_fmax_pct < 0 || rfst_fmax_pct >= 50 )
    Helper::halt( "rfst_fmin_pct and rfst_fmax_pct must be in [0,50)" );

  if ( pass_mul_ph <= 0 || stop_mul_ph <= pass_mul_ph ) 
    Helper::halt( "expecting 0 < pass_mul_ph < stop_mul_ph" );
  
  if ( amp_pass_hz <= 0 || amp_stop_hz <= amp_pass_hz )
    Helper::halt( "expecting 0 < amp_pass_hz < amp_stop_hz" );

  if ( eps_ph <= 0 || eps_ph >= 1 || eps_amp <= 0 || eps_amp >= 1 )
    Helper::halt( "filter ripple (eps_ph, eps_amp) must be in (0,1)" );
  
  if ( f_under_lim_pct < 0 || f_under_lim_pct >= 100 )
    Helper::halt( "f_under_lim_pct must be in [0,100)" );

  if ( f_over_lim && *f_over_lim <= 0 ) 
    Helper::halt( "f_over_lim must be positive" );
  
  if ( platform_amplitude <= 0 ) 
    Helper::halt( "platform_amplitude must be positive, not " + Helper::dbl2str( platform_amplitude ) );

  if ( rig_lo_lim >= rig_hi_lim ) 
    Helper::halt( "rig_lo_lim must be below rig_hi_lim" );

  if ( dyn_cal_err <= 0 )
    Helper::halt( "dyn_cal_err must be positive" );

  if ( rfa_max_imbalance < 0 || phi_min_imbalance < 0 || rig_imbalance < 0 )
    Helper::halt( "imbalance thresholds must be non-negative" );

  if ( min_weight <= 0 || min_weight >= max_weight ) 
    Helper::halt( "expecting 0 < min_weight < max_weight" );

  if ( min_samples < 3 ) 
    Helper::halt( "min_samples must be at least 3" );

  if ( min_sample_rate <= 0 || min_sample_rate >= max_sample_rate )
    Helper::halt( "expecting 0 < min_sample_rate < max_sample_rate" );

  if ( phase_near_18_tol < 0 ) 
    Helper::halt( "phase_near_18_tol must be non-negative" );

  if ( curve_step <= 0 ) 
    Helper::halt( "curve_step must be positive" );

  if ( smooth_order < 0 ) 
    Helper::halt( "smooth_order must be non-negative" );
  
}


double egea_param_t::phase_shift_min( vehicle_type_t t ) const
{
  switch ( t )
    {
    case VEHICLE_M1 : return phase_shift_min_m1;
    case VEHICLE_N1 : return phase_shift_min_n1;
    }
  Helper::halt( "unknown vehicle type" );
  return 0;
}

double egea_param_t::f_under_lim( double static_weight ) const
{
  return static_weight * f_under_lim_pct / 100.0;
}

bool egea_param_t::validate_wheel_weight( double weight_daN ) const
{
  return weight_daN >= min_weight && weight_daN <= max_weight;
}

std::string egea_param_t::dump() const
{
  std::stringstream ss;
  ss << "  wheel weight        " << min_weight << " - " << max_weight << " daN\n"
     << "  frequency window    " << min_calc_freq << " - " << max_calc_freq << " Hz\n"
     << "  phase_shift_min     M1 " << phase_shift_min_m1 << ", N1 " << phase_shift_min_n1 << " deg\n"
     << "  RFst guard          " << rfst_fmin_pct << "% / " << rfst_fmax_pct << "%\n"
     << "  phase filter        pass x" << pass_mul_ph << ", stop x" << stop_mul_ph << ", ripple " << eps_ph << "\n"
     << "  amplitude filter    " << amp_pass_hz << " / " << amp_stop_hz << " Hz, ripple " << eps_amp << "\n"
     << "  under limit         " << f_under_lim_pct << "% of Fst\n"
     << "  over limit          " << ( f_over_lim ? Helper::dbl2str( *f_over_lim ) + " N" : "none" ) << "\n"
     << "  rigidity            " << a_rig << " * H25 / " << platform_amplitude << " + " << b_rig 
     << " (limits " << rig_lo_lim << " - " << rig_hi_lim << ")\n"
     << "  dyn. calibration    " << dyn_cal_err << " N/Hz\n"
     << "  relative criteria   RFAmax " << rfa_max_imbalance << "%, phi_min " << phi_min_imbalance 
     << "%, rigidity " << rig_imbalance << "%\n";
  return ss.str();
}
