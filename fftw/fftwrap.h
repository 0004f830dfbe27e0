
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

#ifndef __SPECSUS_FFTWRAP_H__
#define __SPECSUS_FFTWRAP_H__

#include "fftw3.h"

#include <vector>
#include <cmath>
#include <complex>

#include "helper/helper.h"
#include "defs/defs.h"

//
// Complex FFT
//

class FFT
{
  
 public:

  FFT() : in(NULL) , out(NULL) , p(NULL) { } 

  FFT( int Ndata , int Nfft , double Fs , fft_t type = FFT_FORWARD , window_function_t window = WINDOW_NONE ) 
    : in(NULL) , out(NULL) , p(NULL)
    {
      init( Ndata , Nfft , Fs , type , window );
    }

  void init( int Ndata , int Nfft , double Fs , fft_t type = FFT_FORWARD , window_function_t window = WINDOW_NONE );

  void reset();
  
  ~FFT();
  
 private:

  // FFTW plans and buffers are owned here
  FFT( const FFT & );
  FFT & operator=( const FFT & );
  
  // Size of data 
  int Ndata;
  
  // Sampling rate, so we can construct the appropriate Hz for the PSD
  double Fs;

  // Forward or inverse FFT?
  fft_t type;
  
  // Optional windowing function
  window_function_t window;
  std::vector<double> w;

  // Input signal
  fftw_complex *in;

  // Output signal
  fftw_complex *out;
  
  // FFT plan from FFTW3
  fftw_plan p;

  // Size (NFFT)
  int Nfft;
  
  // Normalisation factor given the window
  double normalisation_factor;

 public:
  
  int cutoff;
  std::vector<double> X;
  std::vector<double> mag;
  std::vector<double> frq;
  
  // sum of window weights (coherent gain * Ndata)
  double window_sum() const;

 public:
  
  bool apply( const std::vector<double> & x );
  bool apply( const double * x , const int n );
  bool apply( const std::vector<std::complex<double> > & x );

  // Extract the raw transform
  std::vector<std::complex<double> > transform() const;
  
  std::vector<double> inverse() const;
    
};

#endif
