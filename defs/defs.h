
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

#ifndef __SPECSUS_DEFS_H__
#define __SPECSUS_DEFS_H__

#include <string>
#include <complex>
#include <vector>

typedef std::complex<double> dcomp;

enum window_function_t
  { 
    WINDOW_NONE = 0 , 
    WINDOW_HANN  
  };

enum fft_t 
{
  FFT_FORWARD,
  FFT_INVERSE
};

struct globals
{
  
  static std::string version;
  static std::string date;

  // return code for the command-line tool
  static int retcode;
  
  // function to bail to if needed (default: throw std::runtime_error)
  static void (*bail_function) ( const std::string & msg );

  // no console output
  static bool silent;

  // if no bail_function, exit the process after halt()
  static bool bail_on_fail;

  // primary initiation of all globals
  void init_defs();
  
};

void specsus_bail_function( const std::string & msg );

#endif
