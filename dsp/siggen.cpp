
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

#include "dsp/siggen.h"
#include "param.h"
#include "helper/helper.h"

#include <vector>
#include <random>
#include <cmath>

sweep_t dsptools::simulate_sweep( const sweep_param_t & sp )
{

  if ( sp.sample_rate <= 0 ) Helper::halt( "requires positive sample rate" );
  if ( sp.duration <= 0 ) Helper::halt( "requires positive sweep duration" );
  if ( sp.f_start <= 0 || sp.f_end <= 0 ) Helper::halt( "sweep frequencies must be positive" );
  if ( sp.f_start >= sp.sample_rate / 2.0 || sp.f_end >= sp.sample_rate / 2.0 )
    Helper::halt( "sweep frequencies not under Nyquist frequency, given sample rate" );
  
  const int np = (int)( sp.duration * sp.sample_rate );
  
  sweep_t s;
  s.static_weight = sp.static_weight;
  s.time.resize( np );
  s.position.resize( np );
  s.force.resize( np );
  s.platform_force.resize( np );

  std::mt19937 rng( sp.seed );
  std::normal_distribution<double> noise( 0.0 , 1.0 );
  
  const double lag = sp.lag_deg * M_PI / 180.0;

  // linear chirp: f(t) = f_start + (f_end - f_start) t / T
  const double k = ( sp.f_end - sp.f_start ) / sp.duration;
  
  for ( int p=0 ; p<np; p++ )
    {
      // time in seconds
      const double t = p / sp.sample_rate;

      const double theta = 2 * M_PI * ( sp.f_start * t + 0.5 * k * t * t );
      
      s.time[p] = t;
      s.position[p] = sp.platform_amplitude * sin( theta );
      s.force[p] = sp.static_weight + sp.force_amplitude * sin( theta - lag );
      s.platform_force[p] = sp.platform_force_amplitude * sin( theta + M_PI / 2.0 );
      
      if ( sp.noise_sd > 0 )
	s.force[p] += sp.noise_sd * noise( rng );
      
      if ( sp.platform_force_noise_sd > 0 )
	s.platform_force[p] += sp.platform_force_noise_sd * noise( rng );
    }
  
  return s;
}


sweep_param_t dsptools::sweep_param( const param_t & param )
{
  sweep_param_t sp;
  if ( param.has( "lag" ) ) sp.lag_deg = param.requires_dbl( "lag" );
  if ( param.has( "fst" ) ) sp.static_weight = param.requires_dbl( "fst" );
  if ( param.has( "amp" ) ) sp.platform_amplitude = param.requires_dbl( "amp" );
  if ( param.has( "force_amp" ) ) sp.force_amplitude = param.requires_dbl( "force_amp" );
  if ( param.has( "noise" ) ) sp.noise_sd = param.requires_dbl( "noise" );
  if ( param.has( "f_start" ) ) sp.f_start = param.requires_dbl( "f_start" );
  if ( param.has( "f_end" ) ) sp.f_end = param.requires_dbl( "f_end" );
  if ( param.has( "dur" ) ) sp.duration = param.requires_dbl( "dur" );
  if ( param.has( "sr" ) ) sp.sample_rate = param.requires_dbl( "sr" );
  if ( param.has( "pf_amp" ) ) sp.platform_force_amplitude = param.requires_dbl( "pf_amp" );
  if ( param.has( "pf_noise" ) ) sp.platform_force_noise_sd = param.requires_dbl( "pf_noise" );
  if ( param.has( "seed" ) ) sp.seed = param.requires_int( "seed" );
  return sp;
}
