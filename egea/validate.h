
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

#ifndef __SPECSUS_EGEA_VALIDATE_H__
#define __SPECSUS_EGEA_VALIDATE_H__

#include <vector>
#include <string>

#include "egea/egea-param.h"

namespace egea 
{ 
  
  // empty string if usable, otherwise the first problem found
  std::string validate_trace( const std::vector<double> & time , 
			      const std::vector<double> & x , 
			      const egea_param_t & param );
  
  std::string validate_sample_set( const std::vector<double> & time , 
				   const std::vector<double> & position , 
				   const std::vector<double> & force , 
				   double static_weight , 
				   const egea_param_t & param );

}

#endif
