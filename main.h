
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


#ifndef __SPECSUS_MAIN_H__
#define __SPECSUS_MAIN_H__

#include <string>
#include <iostream>
#include <new>

struct param_t;
struct wheel_input_t;
struct egea_test_result_t;
struct axle_result_t;

// misc helper: build params from cmdline (key=value, or @param-file)
void build_param( param_t * , int argc , char** argv , int start );

// misc helper: read a whitespace-delimited trace: time position force [platform_force]
void read_trace( const std::string & filename , wheel_input_t * input );

// reports (to stdout)
void report_wheel( const egea_test_result_t & res );
void report_axle( const axle_result_t & res );

// misc helper: manage memory resource issues
void NoMem();

// misc helper: return version
std::string specsus_version();

#endif
