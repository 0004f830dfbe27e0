
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

#include "fftw/fftwrap.h"

#include "helper/helper.h"
#include "defs/defs.h"

#include <mutex>

// FFTW planner calls are not re-entrant; only fftw_execute() is
static std::mutex fftw_planner_mutex;

//
// Complex FFT
//

void FFT::reset() 
{
  if ( p != NULL ) 
    {
      std::lock_guard<std::mutex> lock( fftw_planner_mutex );
      fftw_destroy_plan(p);
    }
  if ( in != NULL ) fftw_free(in);
  if ( out != NULL ) fftw_free(out);
  p = NULL;
  in = out = NULL;
}

FFT::~FFT() 
{    
  reset();
}


void FFT::init( int Ndata_, int Nfft_, double Fs_ , fft_t type_ , window_function_t window_ )
{

  // allow re-use of the same object
  reset();
  
  Ndata = Ndata_;
  Nfft = Nfft_;
  Fs = Fs_;
  type = type_;
  window = window_;

  if ( Ndata > Nfft ) Helper::halt( "Ndata cannot be larger than Nfft" );

  // Allocate storage for input/output
  in = (fftw_complex*) fftw_malloc(sizeof(fftw_complex) * Nfft);
  if ( in == NULL ) Helper::halt( "FFT failed to allocate input buffer" );
  
  out = (fftw_complex*) fftw_malloc(sizeof(fftw_complex) * Nfft);
  if ( out == NULL ) Helper::halt( "FFT failed to allocate output buffer" );

  for (int i=0;i<Nfft;i++) { in[i][0] = in[i][1] = 0; }
  
  // Generate plan
  {
    std::lock_guard<std::mutex> lock( fftw_planner_mutex );
    p = fftw_plan_dft_1d( Nfft, in, out , type == FFT_FORWARD ? FFTW_FORWARD : FFTW_BACKWARD , FFTW_ESTIMATE );
  }
  if ( p == NULL ) Helper::halt( "FFT could not create plan" );
  
  //
  // We want to return only the positive spectrum, so set the cut-off
  //
  
  cutoff = Nfft % 2 == 0 ? Nfft/2+1 : (Nfft+1)/2 ;
  X.resize(cutoff,0);
  mag.resize(cutoff,0);
  frq.resize(cutoff,0);

  //
  // Scale frequencies appropriately (not used in calculation, just for output)
  //

  double T = Nfft/Fs;

  for (int i=0;i<cutoff;i++) frq[i] = i/T;
  
  //
  // Normalisation factor for PSD  (1/value)
  // i.e. equiv. to 1/(N.Fs) in unweighted case, otherwise
  // we take the window into account
  //

  w.resize( Ndata , 1 ); // i.e. default of no window

  if ( window == WINDOW_HANN && Ndata > 1 )
    for (int i=0;i<Ndata;i++) 
      w[i] = 0.5 * ( 1 - cos( 2 * M_PI * i / (double)(Ndata-1) ) );
  
  normalisation_factor = 0;  
  for (int i=0;i<Ndata;i++) normalisation_factor += w[i] * w[i];
  normalisation_factor *= Fs;  
  normalisation_factor = 1.0/normalisation_factor;
    
} 

double FFT::window_sum() const
{
  double s = 0;
  for (int i=0;i<w.size();i++) s += w[i];
  return s;
}

bool FFT::apply( const std::vector<double> & x )
{
  return apply( &(x[0]) , x.size() );
}
  

bool FFT::apply( const double * x , const int n )
{

  if ( n < Ndata ) Helper::halt( "FFT given fewer points than Ndata" );
  
  //
  // Load up (windowed) input buffer
  //
  
  if ( window == WINDOW_NONE )
    for (int i=0;i<Ndata;i++) { in[i][0] = x[i];  in[i][1] = 0; } 
  else
    for (int i=0;i<Ndata;i++) { in[i][0] = x[i] * w[i]; in[i][1] = 0; } 

  for (int i=Ndata;i<Nfft;i++) { in[i][0] = 0;  in[i][1] = 0;  } 
  
  //
  // Execute actual FFT
  // 
  
  fftw_execute(p);
  

  //
  // Calculate PSD
  //

  //
  // psdx = (1/(Fs*N)) * abs(xdft).^2;
  // where abs() is complex sqrt(a^2+b^2)
  //

  for (int i=0;i<cutoff;i++)
    {
      
      double a = out[i][0];
      double b = out[i][1];
      
      X[i] =  ( a*a + b*b ) * normalisation_factor;
      mag[i] = sqrt( a*a + b*b );
 
      // not for DC and Nyquist, but otherwise
      // double all entries (i.e. to preserve
      // total power, as here we have the one-
      // sided PSD
      
      if ( i > 0 && i < cutoff-1 ) X[i] *= 2;
      
    }
  
  return true;

}


bool FFT::apply( const std::vector<std::complex<double> > & x )
{

  const int n = x.size();
  
  if ( n > Nfft || n < Ndata ) Helper::halt( "error in FFT" );
  
  for (int i=0;i<Ndata;i++)
    {
      in[i][0] = std::real( x[i] );
      in[i][1] = std::imag( x[i] );	
    }    

  // zero-pad any remainder
  for (int i=Ndata;i<Nfft;i++)
    {
      in[i][0] =  in[i][1] = 0;
    }

  fftw_execute(p);

  for (int i=0;i<cutoff;i++)
    {
      
      double a = out[i][0];
      double b = out[i][1];
      
      X[i] =  ( a*a + b*b ) * normalisation_factor;
      mag[i] = sqrt( a*a + b*b );

      if ( i > 0 && i < cutoff-1 ) X[i] *= 2;
      
    }
  
  return true;

}


std::vector<std::complex<double> > FFT::transform() const
{
  std::vector<std::complex<double> > r(Nfft);
  for (int i=0;i<Nfft;i++) 
    r[i] = std::complex<double>( out[i][0] , out[i][1] );
  return r;
}

std::vector<double> FFT::inverse() const
{
  // from an IFFT, get the REAL values and divide by N, i.e. this
  // should mirror the input data when the input data are REAL  
  std::vector<double> r(Nfft);
  for (int i=0;i<Nfft;i++) r[i] = out[i][0] / (double)Nfft;
  return r;
}
