
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

#include "egea/rigidity.h"

#include "fftw/fftwrap.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;

rigidity_calculator_t::rigidity_calculator_t( const egea_param_t & p )
  : param( p )
{
  param.validate();
}


rigidity_result_t rigidity_calculator_t::calculate( double h25 ) const
{
  
  rigidity_result_t res;
  res.h25 = h25;
  res.platform_amplitude = param.platform_amplitude;

  if ( ! std::isfinite( h25 ) || h25 < 0 ) 
    {
      res.error = "invalid H25 " + Helper::dbl2str( h25 );
      return res;
    }
  
  res.rigidity = param.a_rig * ( h25 / param.platform_amplitude ) + param.b_rig;

  res.warning_underinflation = res.rigidity < param.rig_lo_lim;
  res.warning_overinflation = res.rigidity > param.rig_hi_lim;
  
  if ( res.warning_underinflation ) 
    Helper::warn( "rigidity " + Helper::dbl2str( res.rigidity , 1 ) + " N/mm below " 
		  + Helper::dbl2str( param.rig_lo_lim ) + ": tire may be under-inflated" );

  if ( res.warning_overinflation ) 
    Helper::warn( "rigidity " + Helper::dbl2str( res.rigidity , 1 ) + " N/mm above " 
		  + Helper::dbl2str( param.rig_hi_lim ) + ": tire may be over-inflated" );
  
  return res;
}


rigidity_result_t rigidity_calculator_t::calculate( const std::vector<double> & reference , double sample_rate ) const
{
  
  if ( reference.size() < 2 || sample_rate <= 50.0 )
    {
      rigidity_result_t res;
      res.platform_amplitude = param.platform_amplitude;
      res.error = "25 Hz reference trace unusable (too short, or sample rate not above 50 Hz)";
      return res;
    }
  
  const double h25 = egea::amplitude_at( reference , sample_rate , 25.0 );
  
  logger << "  rigidity: H25 " << Helper::dbl2str( h25 , 1 ) << " N from 25 Hz reference\n";
  
  return calculate( h25 );
}


rigidity_result_t rigidity_calculator_t::estimate( const std::vector<double> & force ) const
{

  const double h25 = 2.0 * MiscMath::sdev( force );

  Helper::warn( "no 25 Hz reference: H25 estimated as 2 x SD(force) = " + Helper::dbl2str( h25 , 1 ) + " N" );

  rigidity_result_t res = calculate( h25 );
  res.h25_estimated = true;
  return res;
}


double egea::amplitude_at( const std::vector<double> & x , double sample_rate , double frq )
{

  const int n = x.size();

  if ( n < 2 ) Helper::halt( "amplitude_at(): too few samples" );
  if ( frq <= 0 || frq >= sample_rate / 2.0 ) Helper::halt( "amplitude_at(): frequency not under Nyquist" );
  
  // remove DC (e.g. the static weight)
  const double m = MiscMath::mean( x );
  std::vector<double> d( n );
  for (int i=0; i<n; i++) d[i] = x[i] - m;

  // zero-pad for a fine frequency grid
  const int nfft = MiscMath::nextpow2( n ) * 4;
  
  FFT fft( n , nfft , sample_rate , FFT_FORWARD , WINDOW_HANN );
  fft.apply( d );

  // peak within +/- 1 Hz (or one bin) of frq
  const double df = sample_rate / (double)nfft;
  const double w = df > 1.0 ? df : 1.0;
  
  double mx = 0;
  for (int i=0; i<fft.cutoff; i++)
    if ( fabs( fft.frq[i] - frq ) <= w && fft.mag[i] > mx ) 
      mx = fft.mag[i];
  
  return 2.0 * mx / fft.window_sum();
}
