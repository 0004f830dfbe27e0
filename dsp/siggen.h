
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

#ifndef __SPECSUS_DSP_SIGGEN_H__
#define __SPECSUS_DSP_SIGGEN_H__

#include <vector>
#include <string>

struct param_t;

//
// Synthetic EGEA rig traces: a linear frequency sweep of the platform,
// with the tire force lagging the platform by a fixed phase
//

struct sweep_param_t
{

  sweep_param_t()
  {
    f_start = 25.0;
    f_end = 5.0;
    duration = 15.0;
    sample_rate = 1000.0;
    platform_amplitude = 3.0;
    static_weight = 500.0;
    force_amplitude = 200.0;
    lag_deg = 40.0;
    noise_sd = 0;
    platform_force_amplitude = 2.0;
    platform_force_noise_sd = 0;
    seed = 1337;
  }

  double f_start;
  double f_end;
  double duration;            // s
  double sample_rate;         // Hz
  double platform_amplitude;  // mm
  double static_weight;       // N
  double force_amplitude;     // N
  double lag_deg;             // force lags platform by this phase
  double noise_sd;            // N, added to the tire force
  double platform_force_amplitude; // N, unloaded-platform force
  double platform_force_noise_sd;
  unsigned int seed;
  
};


struct sweep_t
{
  std::vector<double> time;
  std::vector<double> position;
  std::vector<double> force;
  std::vector<double> platform_force;
  double static_weight;
};


namespace dsptools 
{ 

  sweep_t simulate_sweep( const sweep_param_t & sp );

  // read sweep options (lag, fst, amp, force_amp, noise, f_start, f_end, dur, sr, ...)
  sweep_param_t sweep_param( const param_t & param );
  
}

#endif
