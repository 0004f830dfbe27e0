
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

#include "param.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <fstream>

extern logger_t logger;

//
// param_t 
//

void param_t::add( const std::string & option , const std::string & value ) 
{

  if ( option == "" ) return;
  
  // key+=value  ","-appends to any existing list
  
  const bool append_mode = option[ option.size() - 1 ] == '+';

  if ( append_mode )
    {
      const std::string option1 = option.substr( 0 , option.size() - 1 );
      if ( option1 == "" ) return;
      if ( opt.find( option1 ) == opt.end() )
	opt[ option1 ] = value;
      else
	opt[ option1 ] = opt[ option1 ] + "," + value;
      return;
    }

  if ( opt.find( option ) != opt.end() ) 
    Helper::halt( option + " parameter specified twice, only one value would be retained" );

  opt[ option ] = value; 
  
}  

int param_t::size() const 
{ 
  return opt.size();
}

void param_t::parse( const std::string & s )
{
  std::vector<std::string> tok = Helper::parse( s , "=" );
  if ( tok.size() == 2 )     add( tok[0] , tok[1] );
  else if ( tok.size() == 1 ) add( tok[0] , "__null__" );
  else // key=value=2 means "value=2" is set to 'key'
    {
      std::string v = tok[1];
      for (int i=2;i<tok.size();i++) v += "=" + tok[i];
      add( tok[0] , v );
    }
}

void param_t::load( const std::string & filename )
{
  if ( ! Helper::fileExists( filename ) ) 
    Helper::halt( "could not open parameter file " + filename );

  std::ifstream IN1( filename.c_str() , std::ios::in );
  int cnt = 0;
  while ( ! IN1.eof() )
    {
      std::string line;
      Helper::safe_getline( IN1 , line );
      if ( IN1.eof() && line == "" ) break;
      
      // strip comments
      const size_t c = line.find( '%' );
      if ( c != std::string::npos ) line = line.substr( 0 , c );

      std::vector<std::string> tok = Helper::parse( line , " \t" );
      for (int i=0; i<tok.size(); i++)
	{
	  parse( tok[i] );
	  ++cnt;
	}
    }
  IN1.close();

  logger << "  read " << cnt << " parameters from " << filename << "\n";
}

void param_t::clear() 
{ 
  opt.clear(); 
} 

bool param_t::has(const std::string & s ) const 
{
  return opt.find(s) != opt.end(); 
} 

bool param_t::empty(const std::string & s ) const
{
  if ( ! has( s ) ) return true; // no key
  return opt.find( s )->second == "__null__";
}

bool param_t::yesno(const std::string & s ) const
{
  if ( ! has( s ) ) return false;
  // a bare flag 'key' means key=T
  if ( empty( s ) ) return true;
  return Helper::yesno( opt.find( s )->second ) ; 
}

std::string param_t::value( const std::string & s , const bool uppercase ) const 
{ 
  if ( has( s ) )
    return uppercase ?
      Helper::remove_all_quotes( Helper::toupper( opt.find( s )->second ) )
      : Helper::remove_all_quotes( opt.find( s )->second );
  else
    return "";
}

std::string param_t::requires( const std::string & s , const bool uppercase ) const
{
  if ( ! has(s) ) Helper::halt( "command requires parameter " + s );
  return value(s, uppercase );
}

int param_t::requires_int( const std::string & s ) const
{
  if ( ! has(s) ) Helper::halt( "command requires parameter " + s );
  int r = 0;
  if ( ! Helper::str2int( value(s) , &r ) ) 
    Helper::halt( "command requires parameter " + s + " to have an integer value" );
  return r;
}

double param_t::requires_dbl( const std::string & s ) const
{
  if ( ! has(s) ) Helper::halt( "command requires parameter " + s );
  double r = 0;
  if ( ! Helper::str2dbl( value(s) , &r ) ) 
    Helper::halt( "command requires parameter " + s + " to have a numeric value" );
  return r;
}

std::string param_t::dump( const std::string & indent , const std::string & delim ) const
{
  std::map<std::string,std::string>::const_iterator ii = opt.begin();
  int sz = opt.size();
  int cnt = 1;
  std::stringstream ss;
  while ( ii != opt.end() ) 
    {

      if ( ii->second != "__null__" )
	ss << indent << ii->first << "=" << ii->second; 
      else
	ss << indent << ii->first ;

      if ( cnt != sz )
	ss << delim; 

      ++cnt;
      ++ii;
    }
  return ss.str();
}

std::vector<double> param_t::dblvector( const std::string & k , const std::string delim ) const
{
  std::vector<double> s;
  if ( ! has(k) ) return s;
  std::vector<std::string> tok = Helper::parse( value(k) , delim );
  for (int i=0;i<tok.size();i++) 
    {
      double d = 0;
      if ( ! Helper::str2dbl( tok[i] , &d ) ) Helper::halt( "Option " + k + " requires a double value(s)" );
      s.push_back(d); 
    }
  return s;
}
