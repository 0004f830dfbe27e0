
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

#include "egea/signal.h"

#include "dsp/fir.h"
#include "dsp/peaks.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <cmath>

std::vector<int> egea::find_platform_tops( const std::vector<double> & position , 
					   const egea_param_t & param , 
					   int min_distance )
{

  if ( position.size() < 3 ) return std::vector<int>();
  
  peaks_t peaks;
  peaks.max = true;
  peaks.min = false;
  
  peaks.distance = min_distance < 0 
    ? (int)( position.size() / ( param.max_calc_freq * 2.0 ) ) 
    : min_distance ;

  // ignore small ripples on the slopes
  peaks.prominence = 0.1 * MiscMath::sdev( position );
  
  peaks.detect( &position );
  
  return peaks.pk;
}


std::vector<egea::crossing_t> egea::find_static_weight_crossings( const std::vector<double> & force , 
								  const std::vector<double> & time , 
								  double static_weight )
{
  std::vector<crossing_t> c;

  const int n = force.size() < time.size() ? force.size() : time.size();
  
  for (int i=0; i<n-1; i++)
    {
      const double a = force[i];
      const double b = force[i+1];

      const bool up = a < static_weight && static_weight < b;
      const bool down = a > static_weight && static_weight > b;

      if ( ! ( up || down ) ) continue;
      
      crossing_t x;
      x.time = time[i] + ( static_weight - a ) / ( b - a ) * ( time[i+1] - time[i] );
      x.dir = up ? CROSS_UP : CROSS_DOWN;
      c.push_back( x );
    }
  
  return c;
}


std::optional<egea::fref_t> egea::locate_fref( const std::vector<double> & force , 
					       const std::vector<double> & time , 
					       double static_weight )
{
  
  std::vector<crossing_t> c = find_static_weight_crossings( force , time , static_weight );

  if ( c.size() < 2 ) return std::nullopt;

  int first_down = -1 , first_up = -1;
  for (int i=0; i<c.size(); i++)
    {
      if ( c[i].dir == CROSS_DOWN && first_down == -1 ) first_down = i;
      if ( c[i].dir == CROSS_UP && first_up == -1 ) first_up = i;
      if ( first_down != -1 && first_up != -1 ) break;
    }

  fref_t r;
  
  if ( first_down != -1 && first_up != -1 )
    {
      r.time = 0.5 * ( c[ first_down ].time + c[ first_up ].time );
      r.low_lobe = first_down < first_up;
    }
  else
    {
      // no direction change found (e.g. a sample landing exactly on Fst):
      // the midpoint of two same-direction crossings is not a trough
      r.time = 0.5 * ( c[0].time + c[1].time );
      r.low_lobe = false;
    }
  
  return r;
}


std::optional<double> egea::calculate_fref( const std::vector<double> & force , 
					    const std::vector<double> & time , 
					    double static_weight )
{
  std::optional<fref_t> r = locate_fref( force , time , static_weight );
  if ( ! r ) return std::nullopt;
  return r->time;
}


bool egea::validate_rfst_conditions( const std::vector<double> & force , 
				     double static_weight , 
				     const egea_param_t & param )
{
  if ( force.size() == 0 ) return false;
  
  double mn, mx;
  MiscMath::minmax( force , &mn , &mx );
  const double delta = mx - mn;
  
  const double lwr = mn + delta * param.rfst_fmin_pct / 100.0;
  const double upr = mx - delta * param.rfst_fmax_pct / 100.0;

  return lwr < static_weight && static_weight < upr;
}


// Kaiser low-pass with the given edges; a stopband past Nyquist is
// clamped, a passband reaching Nyquist needs no filter at all
static std::vector<double> lowpass_taps( double sample_rate , double fpass , double fstop , double ripple )
{
  const double nyquist = sample_rate / 2.0;

  if ( fpass >= nyquist ) return std::vector<double>();
  
  if ( fstop > nyquist ) fstop = nyquist;
  
  const double tw = fstop - fpass;
  
  return dsptools::design_lowpass_fir( ripple , tw , sample_rate , fpass + tw / 2.0 );
}


std::vector<double> egea::egea_phase_filter_taps( double sample_rate , 
						  double frequency_step , 
						  const egea_param_t & param )
{
  if ( sample_rate <= 0 ) Helper::halt( "phase filter requires a positive sample rate" );
  if ( frequency_step <= 0 ) Helper::halt( "phase filter requires a positive frequency" );
  
  return lowpass_taps( sample_rate , 
		       param.pass_mul_ph * frequency_step , 
		       param.stop_mul_ph * frequency_step , 
		       param.eps_ph );
}


std::vector<double> egea::apply_egea_phase_filter( const std::vector<double> & x , 
						   double sample_rate , 
						   double frequency_step , 
						   const egea_param_t & param )
{
  std::vector<double> taps = egea_phase_filter_taps( sample_rate , frequency_step , param );
  if ( taps.size() == 0 ) return x;
  return dsptools::zero_phase_fir( x , taps );
}


std::vector<double> egea::force_amplitude_filter_taps( double sample_rate , 
						       const egea_param_t & param )
{
  if ( sample_rate <= 0 ) Helper::halt( "amplitude filter requires a positive sample rate" );
  return lowpass_taps( sample_rate , param.amp_pass_hz , param.amp_stop_hz , param.eps_amp );
}


std::vector<double> egea::apply_force_amplitude_filter( const std::vector<double> & x , 
							double sample_rate , 
							const egea_param_t & param )
{
  std::vector<double> taps = force_amplitude_filter_taps( sample_rate , param );
  if ( taps.size() == 0 ) return x;
  // whole traces: convolve via FFT
  return dsptools::zero_phase_fir( x , taps , true );
}


void egea::detect_signal_overflow_underflow( const std::vector<double> & x , 
					     double static_weight , 
					     const egea_param_t & param ,
					     bool * under_flag , 
					     bool * over_flag )
{
  *under_flag = *over_flag = false;

  if ( x.size() == 0 ) return;

  double mn, mx;
  MiscMath::minmax( x , &mn , &mx );

  *under_flag = mn < param.f_under_lim( static_weight );

  if ( param.f_over_lim ) 
    *over_flag = mx > *param.f_over_lim;
}


double egea::cycle_frequency( const std::vector<double> & time , int start , int end )
{
  if ( start < 0 || end >= time.size() || end <= start ) return 0;
  const double dt = time[end] - time[start];
  if ( dt <= 0 ) return 0;
  return 1.0 / dt;
}


double egea::estimate_sample_rate( const std::vector<double> & time )
{
  const int n = time.size();
  if ( n < 2 ) return 0;
  const double dur = time[n-1] - time[0];
  if ( dur <= 0 ) return 0;
  return ( n - 1 ) / dur;
}


double egea::normalize_phase( double deg )
{
  double p = fmod( deg , 360.0 );
  if ( p < 0 ) p += 360.0;
  if ( p > 180.0 ) p = 360.0 - p;
  return p;
}
