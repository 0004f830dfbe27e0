
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

// log utility initially based on: https://github.com/Manu343726/Cpp11CustomLogClass

#ifndef __SPECSUS_LOGGER_H__
#define	__SPECSUS_LOGGER_H__

#include <iostream>
#include <sstream>
#include <ctime>
#include <string>
#include <iomanip>
#include <fstream>
#include <mutex>

#include "defs/defs.h"

class logger_t
{

 private:

  const std::string _log_header;

  std::ostream & _out_stream;

  bool           save_log;
  
  std::ofstream  _log_file;
  
  bool         is_off;

  // wheels may be evaluated on several threads at once
  std::recursive_mutex mtx;
  
 public:
  
 logger_t( const std::string & log_header  ,
	  std::ostream& out_stream = std::cerr)
   : _log_header( log_header ) , _out_stream( out_stream ) 
  {
    is_off = false;
    save_log = false;
  }

  void write_log( const std::string & log_file )
  {
    std::lock_guard<std::recursive_mutex> lock( mtx );

    if ( is_off || globals::silent ) return;
    
    // close any existing stream?
    if ( save_log )
      stop_writing_log();
    
    _log_file.open( log_file.c_str() );
    save_log = true;
  }
  
  void stop_writing_log()
  {
    std::lock_guard<std::recursive_mutex> lock( mtx );
    if ( save_log )
      {
	_log_file.close();
	save_log = false;
      }
  }
  
  void flush() { std::lock_guard<std::recursive_mutex> lock( mtx ); _out_stream.flush(); } 

  void off() { flush(); stop_writing_log(); is_off = true; } 

  void banner( const std::string & v , const std::string & bd ) 
  {

    std::lock_guard<std::recursive_mutex> lock( mtx );
    
    if ( is_off || globals::silent ) return;
    
    time_t rawtime;
    time (&rawtime);
    struct tm * timeinfo = localtime (&rawtime);
    
    char BUFFER[50];
    strftime(BUFFER, sizeof(BUFFER), "%d-%b-%Y %H:%M:%S", timeinfo); 

    std::stringstream b;
    b << "===================================================================" << "\n"
      << _log_header
      << " | " << v << ", " << bd << " | starting " << BUFFER  << " +++\n"
      << "===================================================================" << "\n";
    
    _out_stream << b.str();
    _out_stream.flush();
    
    if ( save_log )
      _log_file << b.str();
    
  }
   
  ~logger_t()
    {
      if ( save_log ) 
	_log_file.close();
    }


  void warning( const std::string & msg )
  {
    std::lock_guard<std::recursive_mutex> lock( mtx );
    
    if ( is_off ) return ;
    
    if ( ! globals::silent ) 
      {
	_out_stream << " ** warning: " << msg << " ** " << std::endl;
	if ( save_log )
	  _log_file << " ** warning: " << msg << " ** " << std::endl;
      }
  }
  
  
  template<typename T>           
    logger_t& operator<< (const T& data) 
    {
      std::lock_guard<std::recursive_mutex> lock( mtx );
      
      if ( is_off ) return *this;      
      
      if ( ! globals::silent ) 
	{
	  _out_stream << data;
	  if ( save_log )	
	    _log_file << data;
	}
      
      return *this;

    }
  

};


#endif
