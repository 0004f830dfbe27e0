
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

#include "egea/phase.h"
#include "egea/signal.h"
#include "egea/validate.h"

#include "dsp/fir.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>
#include <algorithm>
#include <sstream>

extern logger_t logger;


phase_shift_analyzer_t::phase_shift_analyzer_t( const egea_param_t & p )
  : param( p )
{
  param.validate();
}


phase_result_t phase_shift_analyzer_t::analyze( const std::vector<double> & position , 
						const std::vector<double> & force , 
						const std::vector<double> & time , 
						double static_weight ) const
{

  phase_result_t res;
  res.static_weight = static_weight;

  //
  // Check input
  //
  
  res.error = egea::validate_sample_set( time , position , force , static_weight , param );
  
  if ( res.error != "" )
    {
      logger << "  phase shift: rejected input (" << res.error << ")\n";
      return res;
    }
  
  const double sr = egea::estimate_sample_rate( time );
  
  //
  // Platform cycles
  //

  const int min_distance = (int)( sr / ( 2.0 * param.max_calc_freq ) );
  
  std::vector<int> tops = egea::find_platform_tops( position , param , min_distance );

  if ( tops.size() < 2 ) 
    {
      logger << "  phase shift: fewer than two platform TOPs found\n";
      return res;
    }

  res.n_cycles = tops.size() - 1;
  
  for (int i=0; i<res.n_cycles; i++)
    {
      phase_period_t period;
      period.period_index = i;
      if ( analyze_cycle( position , force , time , static_weight , sr , tops[i] , tops[i+1] , &period ) )
	res.periods.push_back( period );
    }

  //
  // Whole-trace saturation, on the unfiltered force
  //

  egea::detect_signal_overflow_underflow( force , static_weight , param , &res.f_under_flag , &res.f_over_flag );
  
  aggregate( &res );

  res.curve = egea::phase_curve( res.periods , param );
  
  std::stringstream ss;
  ss << "  phase shift: " << res.n_cycles << " cycles, " << res.periods.size() << " retained";
  if ( res.min_phase_shift ) 
    ss << ", phi_min " << Helper::dbl2str( *res.min_phase_shift , 2 ) 
       << " deg at " << Helper::dbl2str( *res.min_phase_frequency , 2 ) << " Hz";
  if ( res.f_under_flag ) ss << ", underflow";
  if ( res.f_over_flag ) ss << ", overflow";
  ss << "\n";
  logger << ss.str();
  
  return res;
}


bool phase_shift_analyzer_t::analyze_cycle( const std::vector<double> & position , 
					    const std::vector<double> & force , 
					    const std::vector<double> & time , 
					    double static_weight , 
					    double sr , 
					    int s , int e , 
					    phase_period_t * period ) const
{

  const int n = force.size();
  
  const double frq = egea::cycle_frequency( time , s , e );

  if ( frq < param.min_calc_freq || frq > param.max_calc_freq ) 
    {
      if ( param.verbose ) 
	logger << "   cycle " << period->period_index << ": " << frq << " Hz outside window\n";
      return false;
    }

  // cycle is [s,e): the closing TOP belongs to the next cycle
  std::vector<double> cycle_force( force.begin() + s , force.begin() + e );

  if ( ! egea::validate_rfst_conditions( cycle_force , static_weight , param ) ) 
    {
      if ( param.verbose ) 
	logger << "   cycle " << period->period_index << ": RFst condition not met\n";
      return false;
    }

  //
  // Filter the cycle, with one filter length of real signal either side
  // so the cycle itself is not distorted by edge effects
  //
  
  std::vector<double> taps = egea::egea_phase_filter_taps( sr , frq , param );

  std::vector<double> filtered;

  if ( taps.size() == 0 ) 
    filtered = cycle_force;
  else
    {
      const int pad = taps.size();
      const int a = s - pad < 0 ? 0 : s - pad;
      const int b = e + pad > n - 1 ? n - 1 : e + pad;
      std::vector<double> ext( force.begin() + a , force.begin() + b + 1 );
      std::vector<double> fext = dsptools::zero_phase_fir( ext , taps );
      filtered.assign( fext.begin() + ( s - a ) , fext.begin() + ( e - a ) );
    }

  //
  // Cycle-relative times
  //

  const double t0 = time[s];
  std::vector<double> cycle_time( e - s );
  for (int k=s; k<e; k++) cycle_time[k-s] = time[k] - t0;

  std::vector<double> cycle_position( position.begin() + s , position.begin() + e );
  const double top_p = cycle_time[ MiscMath::argmax( cycle_position ) ];
  
  std::optional<egea::fref_t> fref = egea::locate_fref( filtered , cycle_time , static_weight );
  
  if ( ! fref ) 
    {
      if ( param.verbose ) 
	logger << "   cycle " << period->period_index << ": no static-weight crossing pair\n";
      return false;
    }

  //
  // Phase of the force maximum relative to TOP: a midpoint between a
  // down and a later up crossing marks the trough, half a cycle away
  //
  
  double raw = ( fref->time - top_p ) * frq * 360.0;
  if ( fref->low_lobe ) raw += 180.0;

  const double phase = egea::normalize_phase( raw );
  
  if ( phase > param.phase_shift_max ) 
    return false;

  double mn, mx;
  MiscMath::minmax( cycle_force , &mn , &mx );
  
  period->frequency = frq;
  period->phase_shift = phase;
  period->fref = fref->time;
  period->top_p = top_p;
  period->max_force = mx;
  period->min_force = mn;
  period->delta_force = mx - mn;
  period->static_weight = static_weight;
  period->t_start = t0;
  period->is_valid = true;
  
  return true;
}


void phase_shift_analyzer_t::aggregate( phase_result_t * res ) const
{

  const std::vector<phase_period_t> & p = res->periods;
  
  if ( p.size() == 0 ) return;

  int imin = 0;
  int irfa = 0;
  int inear = -1;

  for (int i=0; i<p.size(); i++)
    {
      if ( p[i].phase_shift < p[imin].phase_shift ) imin = i;
      if ( p[i].rfa() > p[irfa].rfa() ) irfa = i;
      
      const double d = fabs( p[i].frequency - param.max_calc_freq );
      if ( d <= param.phase_near_18_tol ) 
	if ( inear == -1 || d < fabs( p[inear].frequency - param.max_calc_freq ) ) 
	  inear = i;
    }

  res->min_phase_shift = p[imin].phase_shift;
  res->min_phase_frequency = p[imin].frequency;

  if ( inear != -1 ) 
    res->max_phase_shift = p[inear].phase_shift;
  
  res->rfa_max_value = p[irfa].rfa();
  res->rfa_max_frequency = p[irfa].frequency;
  
}


phase_curve_t egea::phase_curve( const std::vector<phase_period_t> & periods , 
				 const egea_param_t & param )
{
  phase_curve_t curve;
  
  std::vector<std::pair<double,double> > fp;
  for (int i=0; i<periods.size(); i++)
    if ( periods[i].is_valid ) 
      fp.push_back( std::make_pair( periods[i].frequency , periods[i].phase_shift ) );

  if ( fp.size() < 2 ) return curve;

  std::sort( fp.begin() , fp.end() );

  std::vector<double> f( fp.size() ) , ph( fp.size() );
  for (int i=0; i<fp.size(); i++) 
    {
      f[i] = fp[i].first;
      ph[i] = fp[i].second;
    }
  
  const double step = param.curve_step;
  const double start = ceil( f[0] / step - 1e-9 ) * step;
  const double stop = f[ f.size() - 1 ];

  if ( start > stop ) return curve;
  
  const int ng = (int)floor( ( stop - start ) / step + 1e-9 ) + 1;
  
  curve.frq.resize( ng );
  for (int i=0; i<ng; i++) curve.frq[i] = start + i * step;
  
  curve.phase = MiscMath::interpolate( f , ph , curve.frq );
  
  if ( param.smooth_order > 0 )
    curve.phase = MiscMath::gaussian_smooth( curve.phase , param.smooth_order / 6.0 );
  
  return curve;
}
