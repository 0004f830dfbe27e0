
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

#include "defs.h"
#include "helper/logger.h"

#include <stdexcept>

extern logger_t logger;

std::string globals::version = "v1.0.2";
std::string globals::date    = "14-Mar-2025";

int globals::retcode = 0;

void (*globals::bail_function) ( const std::string & ) = &specsus_bail_function;

bool globals::silent = false;
bool globals::bail_on_fail = true;


void specsus_bail_function( const std::string & msg )
{
  throw( std::runtime_error( msg ) );
}

void globals::init_defs()
{

  //
  // Return code
  //

  retcode = 0;

  //
  // Bail function after halt() is called: halts surface as exceptions,
  // so callers (the CLI, or a service embedding the engine) decide
  //
  
  bail_function = &specsus_bail_function;

  bail_on_fail = true;
  
  //
  // Output
  //

  silent = false;
  
}
