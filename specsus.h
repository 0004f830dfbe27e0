
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

#ifndef __SPECSUS_H__
#define __SPECSUS_H__

#include <cstddef>

#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"

#include "miscmath/miscmath.h"

#include "fftw/fftwrap.h"

#include "dsp/fir.h"
#include "dsp/peaks.h"
#include "dsp/siggen.h"

#include "egea/egea-param.h"
#include "egea/results.h"
#include "egea/signal.h"
#include "egea/validate.h"
#include "egea/phase.h"
#include "egea/force.h"
#include "egea/rigidity.h"
#include "egea/dyncal.h"
#include "egea/criteria.h"
#include "egea/egea.h"

#endif
