
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

#include "egea/dyncal.h"
#include "egea/signal.h"
#include "egea/validate.h"

#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>
#include <sstream>

extern logger_t logger;

dynamic_calibrator_t::dynamic_calibrator_t( const egea_param_t & p )
  : param( p )
{
  param.validate();
}


dyncal_result_t dynamic_calibrator_t::calibrate( const std::vector<double> & platform_force , 
						 const std::vector<double> & time , 
						 double platform_mass ) const
{

  dyncal_result_t res;
  res.platform_mass = platform_mass;

  std::string err = egea::validate_trace( time , platform_force , param );
  if ( err != "" )
    {
      res.error_message = err;
      return res;
    }
  
  const double sr = egea::estimate_sample_rate( time );
  
  // cycles are segmented on the platform force itself
  const int min_distance = (int)( sr / ( 2.0 * param.max_calc_freq ) );
  std::vector<int> tops = egea::find_platform_tops( platform_force , param , min_distance );

  double worst_excess = 0;
  int worst = -1;
  
  for (int i=0; i+1<tops.size(); i++)
    {
      const int s = tops[i];
      const int e = tops[i+1];

      const double frq = egea::cycle_frequency( time , s , e );
      if ( frq < param.min_calc_freq || frq > param.max_calc_freq ) continue;

      int ipk = s;
      double max_fp = 0;
      for (int k=s; k<e; k++)
	if ( fabs( platform_force[k] ) > max_fp ) 
	  {
	    max_fp = fabs( platform_force[k] );
	    ipk = k;
	  }

      // phase of the largest excursion within the cycle
      const double dp = egea::normalize_phase( ( time[ipk] - time[s] ) * frq * 360.0 );
      
      res.max_fp.push_back( max_fp );
      res.delta_period.push_back( dp );
      res.frequencies.push_back( frq );

      const double excess = max_fp - param.dyn_cal_err * frq;
      if ( excess > worst_excess ) 
	{
	  worst_excess = excess;
	  worst = res.max_fp.size() - 1;
	}
    }
  
  // nothing in the window exceeds the budget
  if ( res.max_fp.size() == 0 ) 
    {
      res.is_valid = true;
      logger << "  dynamic calibration: no platform cycles between " << param.min_calc_freq 
	     << " and " << param.max_calc_freq << " Hz\n";
      return res;
    }
  
  if ( worst == -1 ) 
    res.is_valid = true;
  else
    {
      res.is_valid = false;
      res.error_message = "platform force " + Helper::dbl2str( res.max_fp[ worst ] , 2 ) 
	+ " N exceeds limit " + Helper::dbl2str( param.dyn_cal_err * res.frequencies[ worst ] , 2 ) 
	+ " N at " + Helper::dbl2str( res.frequencies[ worst ] , 2 ) + " Hz";
    }
  
  std::stringstream ss;
  ss << "  dynamic calibration: " << res.max_fp.size() << " cycles, " 
     << ( res.is_valid ? "valid" : "invalid (" + *res.error_message + ")" ) << "\n";
  logger << ss.str();
  
  return res;
}
