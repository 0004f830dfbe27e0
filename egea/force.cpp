
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

#include "egea/force.h"
#include "egea/signal.h"
#include "egea/validate.h"

#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <sstream>

extern logger_t logger;

force_analyzer_t::force_analyzer_t( const egea_param_t & p )
  : param( p )
{
  param.validate();
}


force_result_t force_analyzer_t::analyze( const std::vector<double> & force , 
					  const std::vector<double> & time , 
					  double static_weight ) const
{
  
  force_result_t res;
  res.static_weight = static_weight;

  if ( ! ( static_weight > 0 ) ) 
    res.error = "static weight must be positive, not " + Helper::dbl2str( static_weight );
  else
    res.error = egea::validate_trace( time , force , param );
  
  if ( res.error != "" ) 
    {
      logger << "  force: rejected input (" << res.error << ")\n";
      return res;
    }

  const double sr = egea::estimate_sample_rate( time );
  
  std::vector<double> filtered = egea::apply_force_amplitude_filter( force , sr , param );

  const int imin = MiscMath::argmin( filtered );
  const int imax = MiscMath::argmax( filtered );
  
  res.fmin = filtered[ imin ];
  res.fmax = filtered[ imax ];
  res.t_fmin = time[ imin ] - time[0];
  res.t_fmax = time[ imax ] - time[0];
  
  egea::detect_signal_overflow_underflow( filtered , static_weight , param , &res.f_under_flag , &res.f_over_flag );

  //
  // fa_max and resonance depend on which limits were hit
  //

  if ( ! res.f_under_flag && ! res.f_over_flag )
    {
      res.fa_max = static_weight - res.fmin;
      res.resonant_frequency = res.t_fmin > 0 ? 1.0 / ( 2.0 * res.t_fmin ) : 0 ;
    }
  else if ( res.f_under_flag && ! res.f_over_flag )
    {
      res.fa_max = res.fmax - static_weight;
      res.resonant_frequency = res.t_fmax > 0 ? 1.0 / ( 2.0 * res.t_fmax ) : 0 ;
    }
  else
    {
      // the over flag implies a configured over limit
      const double over = *param.f_over_lim;
      const double under = param.f_under_lim( static_weight );
      const double a = over - static_weight;
      const double b = static_weight - under;
      res.fa_max = a > b ? a : b;
      res.resonant_frequency = 0;
    }
  
  res.rfa_max = res.fa_max / static_weight * 100.0;
  
  std::stringstream ss;
  ss << "  force: min " << Helper::dbl2str( res.fmin , 1 ) 
     << " N, max " << Helper::dbl2str( res.fmax , 1 ) 
     << " N, RFAmax " << Helper::dbl2str( res.rfa_max , 1 ) << "%"
     << ", resonance " << Helper::dbl2str( res.resonant_frequency , 2 ) << " Hz\n";
  logger << ss.str();
  
  return res;
}
