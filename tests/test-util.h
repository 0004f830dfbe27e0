
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

#ifndef __SPECSUS_TEST_UTIL_H__
#define __SPECSUS_TEST_UTIL_H__

#include <vector>
#include <cmath>

#include "egea/results.h"

//
// constant-frequency rig trace: position A sin(2 pi f (t+t0)), force
// Fst + B sin(2 pi f (t+t0) - lag)
//

struct tone_t
{
  std::vector<double> time;
  std::vector<double> position;
  std::vector<double> force;
};

inline tone_t make_tone( double frq , double lag_deg , 
			 double dur = 2.0 , double sr = 1000.0 , 
			 double fst = 500.0 , double b = 200.0 , double a = 3.0 , 
			 double t0 = 0 )
{
  tone_t t;
  const int n = (int)( dur * sr );
  const double lag = lag_deg * M_PI / 180.0;
  for (int i=0; i<n; i++)
    {
      const double tt = i / sr;
      const double theta = 2 * M_PI * frq * ( tt + t0 );
      t.time.push_back( tt );
      t.position.push_back( a * sin( theta ) );
      t.force.push_back( fst + b * sin( theta - lag ) );
    }
  return t;
}


// a minimal valid phase result with the given phi_min
inline phase_result_t make_phase_result( double phi , double fst = 500.0 , double frq = 8.0 )
{
  phase_result_t r;
  phase_period_t p;
  p.frequency = frq;
  p.phase_shift = phi;
  p.max_force = fst + 200;
  p.min_force = fst - 200;
  p.delta_force = 400;
  p.static_weight = fst;
  p.is_valid = true;
  r.periods.push_back( p );
  r.n_cycles = 1;
  r.static_weight = fst;
  r.min_phase_shift = phi;
  r.min_phase_frequency = frq;
  r.rfa_max_value = p.rfa();
  r.rfa_max_frequency = frq;
  return r;
}

inline force_result_t make_force_result( double rfa , double fst = 500.0 )
{
  force_result_t r;
  r.static_weight = fst;
  r.rfa_max = rfa;
  r.fa_max = rfa * fst / 100.0;
  r.fmin = fst - r.fa_max;
  r.fmax = fst + r.fa_max;
  return r;
}

inline rigidity_result_t make_rigidity_result( double rig )
{
  rigidity_result_t r;
  r.rigidity = rig;
  r.platform_amplitude = 3.0;
  return r;
}

#endif
