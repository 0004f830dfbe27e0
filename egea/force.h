
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

#ifndef __SPECSUS_EGEA_FORCE_H__
#define __SPECSUS_EGEA_FORCE_H__

#include <vector>

#include "egea/egea-param.h"
#include "egea/results.h"

//
// Whole-trace force extrema, resonance estimate and RFAmax
//

struct force_analyzer_t
{
  
  explicit force_analyzer_t( const egea_param_t & param );

  force_result_t analyze( const std::vector<double> & force , 
			  const std::vector<double> & time , 
			  double static_weight ) const;

 private:
  
  const egea_param_t param;
  
};

#endif
