
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

#ifndef __SPECSUS_HELPER_H__
#define __SPECSUS_HELPER_H__

#include <string>
#include <vector>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace Helper 
{ 
  
  std::string toupper( const std::string & );  

  // trim from start
  static inline std::string ltrim( std::string s ) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) {return !std::isspace(c);}));
    return s;
  }
  
  // trim from end
  static inline std::string rtrim(std::string s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) {return !std::isspace(c);}).base(), s.end());
    return s;
  }
  
  // trim from both ends
  static inline std::string lrtrim( std::string s ) {
    return ltrim(rtrim(s));
  }

  std::string remove_all_quotes(const std::string &s , const char q2 = '"' );
  
  // 0 no NO n N F f false FALSE --> false 
  bool yesno( const std::string & );

  bool iequals(const std::string& a, const std::string& b);
  
  // error handling
  void halt( const std::string & msg );
  void warn( const std::string & msg );
  
  // files
  bool fileExists(const std::string &);
  std::istream& safe_getline(std::istream& is, std::string& t);

  // conversions
  std::string int2str(int n);  
  std::string int2str(long n);
  std::string dbl2str(double n);  
  std::string dbl2str(double n, int dp);  
  
  bool str2dbl(const std::string & , double * ); 
  bool str2int(const std::string & , int * ); 
  
  template <class T>
    bool from_string(T& t,
		     const std::string& s,
		     std::ios_base& (*f)(std::ios_base&))
    {
      std::istringstream iss(s);
      return !(iss >> f >> t).fail();
    }
  
  // tokenize on any of the characters in 's'
  std::vector<std::string> parse(const std::string & item, const std::string & s = " \t\n" , bool empty = false );
  
  std::vector<std::string> char_split( const std::string & s , const char c , bool empty );
  
}

#endif
