
//    --------------------------------------------------------------------
//
//    This file is part of pwruse.
//
//    PWRUSE is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    pwruse is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with pwruse. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#ifndef __PWRUSE_HELPER_H__
#define __PWRUSE_HELPER_H__

#include <iostream>

#include <string>
#include <sstream>
#include <vector>
#include <set>
#include <algorithm> 
#include <cctype>
#include <stdint.h>
#include <map>
#include <cmath>

namespace Helper 
{

  std::string toupper( const std::string & );  

  // trim from start
  static inline std::string ltrim( std::string s ) {
    s.erase(s.begin(), std::find_if( s.begin(), s.end(),  [](unsigned char c) {return !std::isspace(c);} ));
    return s;
  }
 
  // trim from end
  static inline std::string rtrim(std::string s) {
    s.erase(std::find_if( s.rbegin(), s.rend(),  [](unsigned char c) {return !std::isspace(c);} ).base(), s.end() );
    return s;
  }
  
  // trim from both ends
  static inline std::string lrtrim( std::string s ) {
    return ltrim(rtrim(s));
  }

  static inline std::string unquote(const std::string &s , const char q2 = '"' ) {
    if ( s.size() == 0 ) return s;
    int a = ( s[0] == '"' || s[0] == q2 ) ? 1 : 0;
    int b = ( s[s.size()-1] == '"' || s[s.size()-1] == q2 ) ? 1 : 0 ;
    return s.substr(a,s.size()-a-b);
  }

  std::string remove_all_quotes(const std::string &s , const char q2 = '"' );
  
  bool yesno( const std::string & );
  
  // case insenstive string comparison
  bool iequals(const std::string& a, const std::string& b);

  bool fileExists(const std::string &);
  std::string expand( const std::string & f );
  bool deleteFile( const std::string & );
  
  std::istream& safe_getline(std::istream& is, std::string& t);

  void halt( const std::string & msg );
  void warn( const std::string & msg );
  bool realnum(double d);
  
  std::string int2str(int n);  
  std::string dbl2str(double n);  

  template<typename T> 
    std::string stringize( const T & t , const std::string & delim = "," )
    {
      std::stringstream ss;
      
      typename T::const_iterator tt = t.begin();
      while ( tt != t.end() )
	{
	  if ( tt != t.begin() ) ss << delim;
	  ss << *tt;
	  ++tt;
	}
      return ss.str();
    }
  
  bool str2dbl(const std::string & , double * ); 
  bool str2int(const std::string & , int * ); 

  template <class T>
    bool from_string(T& t,
		     const std::string& s,
		     std::ios_base& (*f)(std::ios_base&))
    {
      std::istringstream iss(s);
      if ( (iss >> f >> t).fail() ) return false;
      // do not allow trailing junk, e.g. "12abc"
      std::string rest;
      iss >> rest;
      return rest.size() == 0;
    }
  
  std::vector<std::string> parse(const std::string & item, const std::string & s = " \t\n" , bool empty = false );
  
  std::vector<std::string> quoted_parse(const std::string & item , const std::string & s , const char q = '"' , const char q2 = '\'' , bool empty = false );
  std::vector<std::string> quoted_parse(const std::string & item , const char s , const char q = '"' , const char q2 = '\'' , bool empty = false );

  std::vector<std::string> char_split( const std::string & s , const char c , bool empty );
  std::vector<std::string> char_split( const std::string & s , const char c , const char c2 , bool empty );
  std::vector<std::string> char_split( const std::string & s , const char c , const char c2 , const char c3 , bool empty );

  std::vector<std::string> quoted_char_split( const std::string & s , const char c , const char q , const char q2, bool empty );

  // time-string
  std::string timestring( int h , int m , double s , char delim = ':' , bool fractional = false );
  bool timestring( const std::string & , int * h, int *m , double *s );
  
}



struct date_t {

  // accepts dd-mm-yyyy or yyyy-mm-dd (delimiters: - / .)
  date_t( const std::string & dt );

  date_t( const int d = 1 , const int m = 1 , const int y = 1985 )
    : y(y) , m(m) , d(d) 
  {
    init();
  }

  // parse without halting
  static bool is_valid( const std::string & dt );
  
  // days past 1/1/85
  static int count( const date_t & );
  
  static bool leap_year( const int year )
  {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0 ; 
  }

  static int days_in_month( int mn, int yr )
  {
    static int mlength[] =      { 0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    static int leap_mlength[] = { 0, 31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };    
    return leap_year( yr ) ? leap_mlength[mn] : mlength[mn];    
  }

  std::string as_string() const
  {
    return Helper::int2str( d ) + "-" + Helper::int2str( m ) + "-" + Helper::int2str( y );
  }
  
  void init();
   
  int y;
  int m;
  int d;
  
};



struct clocktime_t
{
  
  // default (midnight, day 0 == 1/1/85)
  clocktime_t() 
  {
    valid = true;
    d=h=m=0;
    s=0.0;
  }

  // hh:mm:ss, yyyy-mm-dd hh:mm:ss or yyyy-mm-ddThh:mm:ss
  clocktime_t( const std::string & t );

  clocktime_t( int h, int m, double s ) 
  : valid(true) , d(0) , h(h), m(m), s(s)
  { 
    if ( h < 0 || m < 0 || s < 0 ) valid = false;
    if ( h > 23 || m > 59 || s >= 60.0 ) valid = false;
  } 

  void parse_string( const std::string & t ); 

  bool valid;
  int d;
  int h;
  int m;
  double s;

  std::string as_string( bool fractional = false ) const
  {
    if ( ! valid ) return "NA";
    return Helper::timestring( h,m,s, ':' , fractional );
  }

  // seconds past the epoch (or past day 'dr')
  double seconds( const int dr = 0 ) const;
  
};


#endif
