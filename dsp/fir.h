
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

#ifndef __SPECSUS_DSP_FIR_H__
#define __SPECSUS_DSP_FIR_H__

#include <vector>
#include <cstdio>
#include <cmath>
#include <cstdlib>
#include <complex>

// https://ptolemy.eecs.berkeley.edu/eecs20/week12/implementation.html

struct fir_impl_t { 
  
  int length;
  std::vector<double> delayLine;
  std::vector<double> coefs;
  int count;
  
  fir_impl_t( const std::vector<double> & coefs_ ); 

  // delay-compensated (centred) convolution, same length as input
  std::vector<double> filter( const std::vector<double> * x );

  // as above, via FFT convolution
  std::vector<double> fft_filter( const std::vector<double> * x );
  
  double getOutputSample(double inputSample) 
  {
    
    delayLine[count] = inputSample;
    
    double result = 0.0;
    
    int index = count;
    
    for (int i=0; i<length; i++) 
      {
	result += coefs[i] * delayLine[index--];
	if (index < 0) index = length-1;
      }
    
    if (++count >= length) count = 0;
    
    return result;
  }

  void reset() 
  {
    count = 0;
    for (int i=0; i<length; i++) delayLine[i] = 0;
  }
  
};



struct fir_t
{

  // class for FIR design, using implementations from "FIR filters by
  // Windowing" by A.Greensted - Feb 2010
  // http://www.labbookpages.co.uk
  // http://www.labbookpages.co.uk/audio/firWindowing.html

  enum filterType { LOW_PASS, HIGH_PASS };
  
  std::vector<double> create1TransSinc( int windowLength, double transFreq, double sampFreq, enum filterType type);

  void calculateKaiserParams(double ripple, double transWidth, double sampFreq, int *windowLength, double *beta);

  std::vector<double> createKaiserWindow( const int windowLength, double beta)
  { std::vector<double> d( windowLength, 1.0); return createKaiserWindow( &d, beta ); }

  std::vector<double> createKaiserWindow( const std::vector<double> *in, double beta);

  double modZeroBessel(double x);

};


namespace dsptools 
{ 
  
  //
  // using Kaiser Window
  //
  
  // ripple: linear (e.g. 0.01); tw: transition width (Hz); f: cut-off
  // (centre of the transition band). Odd number of taps, unit DC gain
  std::vector<double> design_lowpass_fir( double ripple  , double tw , double fs , double f );
  
  //
  // magnitude response of a set of taps, evaluated on a grid of 'nfft'
  // points (zero-padded); returns |H| and sets the frequencies
  //

  std::vector<double> fir_response( const std::vector<double> & coefs , double fs , int nfft , std::vector<double> * frq );
  
  //
  // apply FIR forward, then on the time-reversed output, so that no
  // time shift is introduced; the ends are padded by odd reflection
  //
  
  std::vector<double> zero_phase_fir( const std::vector<double> & x , const std::vector<double> & coefs , bool use_fft = false );
  
}


#endif
