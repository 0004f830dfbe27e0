
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

#include "egea/results.h"

#include <cmath>

double phase_period_t::rfa() const
{
  if ( static_weight <= 0 ) return 0;
  const double up = fabs( max_force - static_weight );
  const double dn = fabs( min_force - static_weight );
  return ( up > dn ? up : dn ) / static_weight * 100.0;
}

std::string quality_str( quality_t q )
{
  switch ( q )
    {
    case QUALITY_EXCELLENT  : return "EXCELLENT";
    case QUALITY_GOOD       : return "GOOD";
    case QUALITY_ACCEPTABLE : return "ACCEPTABLE";
    case QUALITY_POOR       : return "POOR";
    }
  return "?";
}
