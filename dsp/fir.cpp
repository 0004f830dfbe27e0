
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

#include "fir.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "fftw/fftwrap.h"
#include "miscmath/miscmath.h"

#include <algorithm>

extern logger_t logger;


fir_impl_t::fir_impl_t( const std::vector<double> & coefs_ ) 
{
  count = 0;
  length = coefs_.size();
  coefs = coefs_;
  delayLine.resize( length );
  
  // expecting a linear-phase FIR with odd number of coefficients
  if ( coefs.size() % 2 != 1 ) Helper::halt( "expecting odd number of taps in FIR" );
  int del = ( coefs.size() - 1 ) / 2 ;
  
  double checksum = 0;
  for (int i=0;i<del;i++)
    checksum += fabs( coefs[i] - coefs[ coefs.size() - 1 - i ] );
  if ( checksum > 1e-8 ) Helper::halt( "problem in filter: taps not symmetric" );
  
}


std::vector<double> dsptools::design_lowpass_fir( double ripple  , double tw , double fs , double f )
{
  
  if ( fs <= 0 ) Helper::halt( "design_lowpass_fir: sample rate must be positive" );
  if ( tw <= 0 ) Helper::halt( "design_lowpass_fir: transition width must be positive" );
  if ( f <= 0 || f >= fs / 2.0 ) Helper::halt( "design_lowpass_fir: cut-off must be between 0 and Nyquist" );
  if ( ripple <= 0 || ripple >= 1 ) Helper::halt( "design_lowpass_fir: ripple must be in (0,1)" );
  
  fir_t fir;

  int kaiserWindowLength;
  double beta;

  fir.calculateKaiserParams( ripple , tw , fs , &kaiserWindowLength, &beta);
  if ( kaiserWindowLength % 2 == 0 ) ++kaiserWindowLength;

  std::vector<double> fc = fir.create1TransSinc( kaiserWindowLength, f , fs , fir_t::LOW_PASS );

  fc = fir.createKaiserWindow(&fc, beta);

  // unit gain at DC, so a constant level passes unchanged
  double dc = 0;
  for (int i=0; i<fc.size(); i++) dc += fc[i];
  if ( dc <= 0 ) Helper::halt( "design_lowpass_fir: degenerate filter" );
  for (int i=0; i<fc.size(); i++) fc[i] /= dc;
  
  return fc;
}


// Create sinc function for filter with 1 transition - Low and High pass filters
std::vector<double> fir_t::create1TransSinc(int windowLength, double transFreq, double sampFreq, enum filterType type)
{
  
  // Allocate memory for the window
  std::vector<double> window( windowLength );
  
  if (type != LOW_PASS && type != HIGH_PASS) 
    Helper::halt("create1TransSinc: Bad filter type, should be either LOW_PASS of HIGH_PASS");
  
  // Calculate the normalised transistion frequency. As transFreq should be
  // less than or equal to sampFreq / 2, ft should be less than 0.5
  double ft = transFreq / sampFreq;
  
  double m_2 = 0.5 * (windowLength-1);
  int halfLength = windowLength / 2;
  
  // Set centre tap, if present
  // This avoids a divide by zero
  if (2*halfLength != windowLength) {
    double val = 2.0 * ft;
    
    // If we want a high pass filter, subtract sinc function from a dirac pulse
    if (type == HIGH_PASS) val = 1.0 - val;
    
    window[halfLength] = val;
  }
  else if (type == HIGH_PASS) 
    Helper::halt("create1TransSinc: For high pass filter, window length must be odd");
   
  // This has the effect of inverting all weight values
  if (type == HIGH_PASS) ft = -ft;
  
  // Calculate taps
  // Due to symmetry, only need to calculate half the window
  for (int n=0 ; n<halfLength ; n++) 
    {
      double val = sin(2.0 * M_PI * ft * (n-m_2)) / (M_PI * (n-m_2));      
      window[n] = val;
      window[windowLength-n-1] = val;
    }
  
  return window;
}


// Transition Width (transWidth) is given in Hz
// Sampling Frequency (sampFreq) is given in Hz
// Window Length (windowLength) will be set
void fir_t::calculateKaiserParams(double ripple, double transWidth, double sampFreq, int *windowLength, double *beta)
{
  // Calculate delta w
  double dw = 2 * M_PI * transWidth / sampFreq;
  
  // Calculate ripple dB
  double a = -20.0 * log10(ripple);
  
  // Calculate filter order
  int m;
  if (a>21) m = ceil((a-7.95) / (2.285*dw));
  else m = ceil(5.79/dw);
  
  *windowLength = m + 1;
  
  if (a<=21) *beta = 0.0;
  else if (a<=50) *beta = 0.5842 * pow(a-21, 0.4) + 0.07886 * (a-21);
  else *beta = 0.1102 * (a-8.7);
}


std::vector<double> fir_t::createKaiserWindow( const std::vector<double> * in, double beta )
{

  const int windowLength = in->size();
  std::vector<double> out( windowLength );

  if ( windowLength == 1 ) 
    {
      out[0] = (*in)[0];
      return out;
    }
  
  double m_2 = (double)(windowLength-1) / 2.0;
  double denom = modZeroBessel(beta);  // Denominator of Kaiser function
    
  for (int n=0 ; n<windowLength ; n++)
    {
      double val = ((n) - m_2) / m_2;
      val = 1 - (val * val);
      out[n] = modZeroBessel(beta * sqrt(val)) / denom;
    }
  
  // multiply with the input
  for (int n=0 ; n<windowLength ; n++) 
    out[n] *= (*in)[n];
  
  return out;
}

double fir_t::modZeroBessel(double x)
{

  double x_2 = x/2;
  double num = 1;
  double fact = 1;
  double result = 1;
  
  for (int i=1 ; i<20 ; i++) {
    num *= x_2 * x_2;
    fact *= i;
    result += num / (fact * fact);  
  }  
  return result;
}


std::vector<double> dsptools::fir_response( const std::vector<double> & coefs , double fs , int nfft , std::vector<double> * frq )
{

  const int windowLength = coefs.size();

  if ( windowLength == 0 ) Helper::halt( "fir_response: no taps" );
  
  // If the window length is short, zero padding will be used
  int fftSize = nfft < windowLength ? windowLength : nfft;
  
  FFT fft( windowLength , fftSize , fs , FFT_FORWARD );
  fft.apply( coefs );

  if ( frq != NULL ) *frq = fft.frq;
  
  return fft.mag;
}


std::vector<double> fir_impl_t::filter( const std::vector<double> * x ) 
{
  
  if ( length % 2 == 0 ) Helper::halt("fir_impl_t requries odd # of coeffs");

  reset();
  
  const int n = x->size();
  
  const int delay_idx = (length-1)/2;
  
  std::vector<double> r( n ) ;

  if ( n == 0 ) return r;
  
  // burn in (implicit zeros past the end of a short input)
  int i = 0;
  for ( ; i<delay_idx; i++) 
    getOutputSample( i < n ? (*x)[i] : 0 );
  
  // process
  int j = 0;
  for ( ; i<n; i++) 
    r[j++] = getOutputSample( (*x)[i] );
  
  // zero-pad end of signal
  while ( j < n ) 
    r[j++] = getOutputSample( 0 );
  
  return r;
  
}


std::vector<double> fir_impl_t::fft_filter( const std::vector<double> * px )
{
  
  std::vector<double> x = *px;
  std::vector<double> h = coefs;
  
  // signal length
  const int M = x.size();
  
  // filter length
  const int L = h.size();

  if ( M == 0 ) return x;
  
  // next power of 2 greater than M+L-1
  long int Nfft = MiscMath::nextpow2( M + L - 1 );
  
  // zero-padding
  x.resize( Nfft , 0 );
  h.resize( Nfft , 0 );

  // FFT
  FFT fftx( Nfft , Nfft , 1 , FFT_FORWARD );
  fftx.apply( x );
  std::vector<dcomp> rfftx = fftx.transform();
  
  FFT ffth( Nfft , Nfft , 1 , FFT_FORWARD );
  ffth.apply( h );
  std::vector<dcomp> rffth = ffth.transform();
  
  // convolution in the frequency domain

  std::vector<dcomp> y( Nfft );
  for (int i=0;i<rfftx.size();i++) y[i] = rfftx[i] * rffth[i]; 
  
  // inverse FFT

  FFT ifft( Nfft , Nfft , 1 , FFT_INVERSE );
  ifft.apply( y );
  std::vector<double> conv_tmp = ifft.inverse();
  
  // Trim (compensating the group delay) and return real component
  std::vector<double> conv( M );
  const int delay_idx = (length-1)/2;
  for (int i=0;i<M;i++)
    conv[i] = conv_tmp[ i + delay_idx ];

  return conv;
  
}


std::vector<double> dsptools::zero_phase_fir( const std::vector<double> & x , const std::vector<double> & coefs , bool use_fft )
{
  
  const int n = x.size();
  if ( n == 0 ) return x;

  fir_impl_t fir( coefs );
  
  //
  // pad each side by one filter length: odd reflection about the end
  // sample, holding the last reflected value if the input is shorter
  //

  const int npad = fir.length;

  std::vector<double> padded( n + 2 * npad );

  const double x0 = x[0];
  const double x1 = x[n-1];
  
  for (int k=1; k<=npad; k++)
    {
      const int kk = k < n ? k : n - 1;
      padded[ npad - k ] = 2 * x0 - x[ kk ];
      padded[ npad + n - 1 + k ] = 2 * x1 - x[ n - 1 - kk ];
    }

  for (int i=0; i<n; i++) padded[ npad + i ] = x[i];
  
  // forward 
  std::vector<double> y = use_fft ? fir.fft_filter( &padded ) : fir.filter( &padded );

  // reverse
  std::reverse( y.begin() , y.end() );
  y = use_fft ? fir.fft_filter( &y ) : fir.filter( &y );
  std::reverse( y.begin() , y.end() );

  return std::vector<double>( y.begin() + npad , y.begin() + npad + n );
  
}
