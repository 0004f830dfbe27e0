
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

#include "egea/validate.h"
#include "egea/signal.h"

#include "helper/helper.h"

#include <cmath>

static bool all_finite( const std::vector<double> & x )
{
  for (int i=0; i<x.size(); i++)
    if ( ! std::isfinite( x[i] ) ) return false;
  return true;
}

std::string egea::validate_trace( const std::vector<double> & time , 
				  const std::vector<double> & x , 
				  const egea_param_t & param )
{

  const int n = time.size();
  
  if ( x.size() != n ) 
    return "signal length (" + Helper::int2str( (int)x.size() ) 
      + ") does not match time length (" + Helper::int2str( n ) + ")";
  
  if ( n < param.min_samples ) 
    return "too few samples: " + Helper::int2str( n ) 
      + " (need at least " + Helper::int2str( param.min_samples ) + ")";

  if ( ! all_finite( time ) ) return "non-finite value in time";
  if ( ! all_finite( x ) ) return "non-finite value in signal";

  for (int i=1; i<n; i++)
    if ( time[i] <= time[i-1] ) 
      return "time is not strictly increasing at sample " + Helper::int2str( i );

  const double sr = estimate_sample_rate( time );

  if ( sr < param.min_sample_rate || sr > param.max_sample_rate )
    return "sample rate " + Helper::dbl2str( sr , 1 ) + " Hz outside " 
      + Helper::dbl2str( param.min_sample_rate ) + " - " + Helper::dbl2str( param.max_sample_rate ) + " Hz";
  
  return "";
}


std::string egea::validate_sample_set( const std::vector<double> & time , 
				       const std::vector<double> & position , 
				       const std::vector<double> & force , 
				       double static_weight , 
				       const egea_param_t & param )
{

  if ( position.size() != force.size() || position.size() != time.size() ) 
    return "array length mismatch: time " + Helper::int2str( (int)time.size() ) 
      + ", position " + Helper::int2str( (int)position.size() ) 
      + ", force " + Helper::int2str( (int)force.size() );
  
  if ( ! ( static_weight > 0 ) ) 
    return "static weight must be positive, not " + Helper::dbl2str( static_weight );

  std::string err = validate_trace( time , force , param );
  if ( err != "" ) return err;

  if ( ! all_finite( position ) ) return "non-finite value in platform position";

  return "";
}
