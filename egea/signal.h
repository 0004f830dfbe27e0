
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

#ifndef __SPECSUS_EGEA_SIGNAL_H__
#define __SPECSUS_EGEA_SIGNAL_H__

#include <vector>
#include <optional>

#include "egea/egea-param.h"

//
// Signal primitives shared by the EGEA analyzers
//

namespace egea 
{ 

  enum crossing_dir_t { CROSS_UP , CROSS_DOWN };

  struct crossing_t 
  {
    double time;
    crossing_dir_t dir;
  };

  // fref plus the lobe it centres on
  struct fref_t 
  {
    double time;

    // true: midpoint of a below-Fst interval (the force trough)
    bool low_lobe;
  };
  
  // platform TOP indices, ascending; min_distance in samples, or -1 for
  // length / ( 2 * max_calc_freq ) 
  std::vector<int> find_platform_tops( const std::vector<double> & position , 
				       const egea_param_t & param , 
				       int min_distance = -1 );
  
  // every strict pass of the force through static_weight, linearly interpolated
  std::vector<crossing_t> find_static_weight_crossings( const std::vector<double> & force , 
							const std::vector<double> & time , 
							double static_weight );

  // midpoint of the first down and first up crossing (else of the first
  // two crossings); none if fewer than two crossings
  std::optional<double> calculate_fref( const std::vector<double> & force , 
					const std::vector<double> & time , 
					double static_weight );

  std::optional<fref_t> locate_fref( const std::vector<double> & force , 
				     const std::vector<double> & time , 
				     double static_weight );
  
  // min + range * fmin% < Fst < max - range * fmax%
  bool validate_rfst_conditions( const std::vector<double> & force , 
				 double static_weight , 
				 const egea_param_t & param );

  // zero-phase low-pass, passband pass_mul_ph * f, stopband stop_mul_ph * f
  std::vector<double> apply_egea_phase_filter( const std::vector<double> & x , 
					       double sample_rate , 
					       double frequency_step , 
					       const egea_param_t & param );

  // taps used by apply_egea_phase_filter() (empty: no filtering needed)
  std::vector<double> egea_phase_filter_taps( double sample_rate , 
					      double frequency_step , 
					      const egea_param_t & param );
  
  // zero-phase wideband low-pass (50 / 130 Hz by default)
  std::vector<double> apply_force_amplitude_filter( const std::vector<double> & x , 
						    double sample_rate , 
						    const egea_param_t & param );

  std::vector<double> force_amplitude_filter_taps( double sample_rate , 
						   const egea_param_t & param );
  
  void detect_signal_overflow_underflow( const std::vector<double> & x , 
					 double static_weight , 
					 const egea_param_t & param ,
					 bool * under_flag , 
					 bool * over_flag );

  // 1 / duration of [start,end] (0 if degenerate)
  double cycle_frequency( const std::vector<double> & time , int start , int end );
  
  // mean sample rate over the trace
  double estimate_sample_rate( const std::vector<double> & time );

  // wrap to [0,360), then fold onto [0,180]
  double normalize_phase( double deg );
  
}

#endif
