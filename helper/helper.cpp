
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

#include "helper.h"
#include "logger.h"
#include "defs/defs.h"

#include <iomanip>
#include <cstdio>
#include <cstdlib>

extern logger_t logger;

std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( s[i] );
  return j;
}

std::string Helper::remove_all_quotes(const std::string &s , const char q2 )
{
  const int n = s.size();
  int n2 = 0;
  for (int i=0; i<n; i++) { if ( ! ( s[i] == '"' || s[i] == q2 ) ) ++n2; } 
  if ( n2 == n ) return s;
  std::string r( n2 , ' ' );
  int j = 0;
  for (int i=0; i<n; i++)
    {
      if ( ! ( s[i] == '"' || s[i] == q2 ) )
	{
	  r[j] = s[i];
	  ++j;
	}
    }
  return r;
}

void Helper::halt( const std::string & msg )
{
  
  // some other code handles the exit (by default, we throw)
  if ( globals::bail_function != NULL ) 
    globals::bail_function( msg );
  
  // do not kill the process? 
  if ( ! globals::bail_on_fail ) return;
  
  // switch logger off , i.e. as we don't want close-out msg
  logger.off();
  
  // generic bail function (not using logger)
  std::cerr << "error : " << msg << "\n";   

  std::exit(1);
}

void Helper::warn( const std::string & msg )
{
  logger.warning( msg );
}

std::string Helper::int2str(int n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(long n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n, int dp )
{
  std::ostringstream ss( std::stringstream::out );
  ss << std::fixed
     << std::setprecision( dp );
  ss << n;
  return ss.str();
}

bool Helper::str2dbl(const std::string & s , double * d)
{
  return from_string<double>(*d,s,std::dec);
}

bool Helper::str2int(const std::string & s , int * i)
{
  return from_string<int>(*i,s,std::dec);
}

std::vector<std::string> Helper::parse(const std::string & item, const std::string & s , bool empty )
{  
  if ( s.size() == 0 ) Helper::halt( "no delimiters given to parse()" );
  if ( s.size() == 1 ) return Helper::char_split( item , s[0] , empty ); 
  
  // normalize all delimiters to the first one
  std::string t = item;
  for (int j=0; j<t.size(); j++)
    if ( s.find( t[j] ) != std::string::npos ) t[j] = s[0];
  return Helper::char_split( t , s[0] , empty );
}  

std::vector<std::string> Helper::char_split( const std::string & s , const char c , bool empty )
{

  std::vector<std::string> strs;  
  if ( s.size() == 0 ) return strs;
  int p=0;

  for (int j=0; j<s.size(); j++)
    {	        
      if ( s[j] == c ) 
	{ 	      
	  if ( j == p ) // empty slot?
	    {
	      if ( empty ) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(s.substr(p,j-p)); 
	      p=j+1; 
	    }
	}	  
    }
  
  if ( empty && p == s.size() ) 
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );
  
  return strs;
}

std::istream& Helper::safe_getline(std::istream& is, std::string& t)
{
  t.clear();

  // guard reads from the streambuf with a sentry object
  std::istream::sentry se(is, true);
  std::streambuf* sb = is.rdbuf();
  
  for ( ; ; ) 
    {
      
      int c = sb->sbumpc();
      
      switch (c) 
	{
	case '\n':
	  return is;
	  
	case '\r':
	  if (sb->sgetc() == '\n')
	    sb->sbumpc();
	  return is;

	case std::streambuf::traits_type::eof():
	  // also handle the case when the last line has no line ending
	  if (t.empty())
	    is.setstate(std::ios::eofbit);
	  return is;
	  
	default:
	  t += (char)c;
	}
    }
}

bool Helper::fileExists( const std::string & f )
{

  FILE *file;

  if ( ( file = fopen( f.c_str() , "r" ) ) ) 
    {
      fclose(file);
      return true;
    } 

  return false;

}

bool Helper::iequals(const std::string& a, const std::string& b)
{
  unsigned int sz = a.size();
  if (b.size() != sz)
    return false;
  for (unsigned int i = 0; i < sz; ++i)
    if (tolower(a[i]) != tolower(b[i]))
      return false;
  return true;
}

bool Helper::yesno( const std::string & s )
{
  if ( s.size() == 0 ) return false; // empty == NO
  if ( s[0] == '0' || s[0] == 'n' || s[0] == 'N' || s[0] == 'f' || s[0] == 'F' ) return false;
  return true;
}
