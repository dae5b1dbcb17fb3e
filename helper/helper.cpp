
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

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <iomanip>
#include <fstream>
#include <cstdio>
#include <cstdlib>

extern logger_t logger;


std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( (unsigned char)s[i] );
  return j;
}

std::string Helper::remove_all_quotes(const std::string &s , const char q2 )
{
  std::string r;
  r.reserve( s.size() );
  for (int i=0; i<s.size(); i++)
    if ( ! ( s[i] == '"' || s[i] == q2 ) ) r += s[i];
  return r;
}

std::string Helper::expand( const std::string & f )
{
  // only expand ~ if first character for home-folder subst
  if ( f.size() == 0 ) return f;
  if ( f[0] != '~' ) return f;
  const char * home = getenv("HOME");
  if ( home == NULL ) return f;
  return std::string( home ) + f.substr(1);
}

void Helper::halt( const std::string & msg )
{
  
  // some other code handles the exit, e.g. test harness or library use
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

bool Helper::realnum(double d)
{
  return std::isfinite( d );
}

std::string Helper::int2str(int n)
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

bool Helper::str2dbl(const std::string & s , double * d)
{
  return from_string<double>(*d,s,std::dec);
}

bool Helper::str2int(const std::string & s , int * i)
{
  return from_string<int>(*i,s,std::dec);
}

bool Helper::yesno( const std::string & s )
{
  // 0 no NO n N F f false FALSE 
  // versus all else  (including empty, i.e. 'var'  --> 'var=T' 
  if ( s.size() == 0 ) return false; // empty == NO
  if ( s[0] == '0' || s[0] == 'n' || s[0] == 'N' || s[0] == 'f' || s[0] == 'F' ) return false;
  return true;
}

bool Helper::iequals(const std::string& a, const std::string& b)
{
  unsigned int sz = a.size();
  if (b.size() != sz)
    return false;
  for (unsigned int i = 0; i < sz; ++i)
    if ( std::tolower( (unsigned char)a[i] ) != std::tolower( (unsigned char)b[i] ) )
      return false;
  return true;
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

bool Helper::deleteFile( const std::string & f )
{
  if ( ! fileExists( f ) ) return false; 
  if ( remove( f.c_str() )  != 0 ) Helper::halt( "problem deleting " + f );
  return true;
}


// https://stackoverflow.com/questions/6089231/getting-std-ifstream-to-handle-lf-cr-and-crlf

std::istream& Helper::safe_getline(std::istream& is, std::string& t)
{
  t.clear();

  // characters are read one-by-one via the streambuf, guarded by a sentry
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

 	case std::streambuf::traits_type::eof() :
 	  // Also handle the case when the last line has no line ending
 	  if(t.empty())
 	    is.setstate(std::ios::eofbit);
 	  return is;
	  
	default:
	  t += (char)c;
	}
    }
}


std::vector<std::string> Helper::parse(const std::string & item, const std::string & s , bool empty )
{  
  if ( s.size() == 1 ) return Helper::char_split( item , s[0] , empty ); 
  if ( s.size() == 2 ) return Helper::char_split( item , s[0] , s[1] , empty ); 
  if ( s.size() == 3 ) return Helper::char_split( item , s[0] , s[1] , s[2] , empty ); 
  Helper::halt("silly internal error in parse/char_split");
  std::vector<std::string> dummy;
  return dummy;
}  

std::vector<std::string> Helper::quoted_parse(const std::string & item , const char s , const char q , const char q2, bool empty )
{
  return Helper::quoted_char_split( item , s , q, q2, empty ); 
}

std::vector<std::string> Helper::quoted_parse(const std::string & item , const std::string & s , const char q , const char q2, bool empty )
{
  if ( s.size() == 1 ) return Helper::quoted_char_split( item , s[0] , q, q2, empty ); 
  Helper::halt("silly internal error in quoted_parse");
  std::vector<std::string> dummy;
  return dummy;
}


std::vector<std::string> Helper::char_split( const std::string & s , const char c , bool empty )
{
  return char_split( s , c , c , c , empty );
}

std::vector<std::string> Helper::char_split( const std::string & s , const char c , const char c2 , bool empty )
{
  return char_split( s , c , c2 , c2 , empty );
}

std::vector<std::string> Helper::char_split( const std::string & s , const char c , const char c2 , const char c3 , bool empty )
{
  std::vector<std::string> strs;  
  if ( s.size() == 0 ) return strs;
  int p=0;

  for (int j=0; j<s.size(); j++)
    {	        
      if ( s[j] == c || s[j] == c2 || s[j] == c3 ) 
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


std::vector<std::string> Helper::quoted_char_split( const std::string & s , const char c , const char q , const char q2, bool empty )
{

  std::vector<std::string> strs;  
  if ( s.size() == 0 ) return strs;
  int p=0;
  
  bool in_quote = false;
  
  for (int j=0; j<s.size(); j++)
    {	        

      if ( s[j] == '"' || s[j] == q || s[j] == q2 ) in_quote = ! in_quote;
      
      if ( (!in_quote) && s[j] == c ) 
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


std::string Helper::timestring( int h , int m , double sec , char delim , bool fractional )
{
  // adjust any small rounding error
  if ( sec < 0 ) sec = 0;
  
  // return 00:00:00 or 00:00:00.000 format
  std::stringstream ss;

  if ( h < 10 ) ss << "0";
  ss << h << delim;
  if ( m < 10 ) ss << "0";
  ss << m << delim;
  if ( sec < 10.0 ) ss << "0";
  
  if ( fractional ) 
    ss << std::fixed << std::setprecision( globals::time_format_dp ) << sec;
  else
    ss << floor( sec );
  
  return ss.str();		  
}


bool Helper::timestring( const std::string & t , int * h, int *m , double *s )
{

  // valid formats:     hh:mm  
  //                    hh:mm:ss
  //                    hh:mm:ss.sss
  
  *h = *m = 0;  
  *s = 0.0;

  std::vector<std::string> tokc = Helper::parse( t , ":" );
  
  if ( tokc.size() == 2 ) 
    {	  
      if ( ! Helper::str2int( tokc[0] , h ) ) return false;
      if ( ! Helper::str2int( tokc[1] , m ) ) return false;
      return true;
    }
  
  if ( tokc.size() == 3 ) 
    {
      if ( ! Helper::str2int( tokc[0] , h ) ) return false;
      if ( ! Helper::str2int( tokc[1] , m ) ) return false;
      if ( ! Helper::str2dbl( tokc[2] , s ) ) return false;
      return true;
    }

  return false;
}



//
// date_t
//

bool date_t::is_valid( const std::string & dt )
{
  std::vector<std::string> tok = Helper::parse( dt , "./-" );
  if ( tok.size() != 3 ) return false;

  // yyyy-mm-dd if the first field has four digits, else dd-mm-yyyy
  const bool is_ymd = tok[0].size() == 4;
  
  int d1 = 0 , m1 = 0 , y1 = 0;
  if ( ! Helper::str2int( is_ymd ? tok[2] : tok[0] , &d1 ) ) return false;
  if ( ! Helper::str2int( tok[1] , &m1 ) ) return false;
  if ( ! Helper::str2int( is_ymd ? tok[0] : tok[2] , &y1 ) ) return false;

  if ( y1 >= 0  && y1 < 85 ) y1 += 2000;
  else if ( y1 >= 85 && y1 < 100 ) y1 += 1900;

  if ( y1 < 1985 || y1 > 3000 ) return false;
  if ( m1 < 1 || m1 > 12 ) return false;
  if ( d1 < 1 || d1 > days_in_month( m1 , y1 ) ) return false;
  return true;
}

date_t::date_t( const std::string & dt )
{
  std::vector<std::string> tok = Helper::parse( dt , "./-" );
  if ( tok.size() != 3 ) Helper::halt( "invalid date string: " + dt );

  const bool is_ymd = tok[0].size() == 4;

  d=m=y=0;
  
  if ( ! Helper::str2int( is_ymd ? tok[2] : tok[0] , &d ) )
    Helper::halt( "invalid day value: " + dt );
  if ( ! Helper::str2int( tok[1] , &m ) )
    Helper::halt( "invalid month value: " + dt );
  if ( ! Helper::str2int( is_ymd ? tok[0] : tok[2] , &y ) )
    Helper::halt( "invalid year value: " + dt );

  init();
}

void date_t::init()
{

  // YY --> YYYY conversion 1985 -- 2084
  if      ( y >= 0  && y < 85 ) y += 2000;
  else if ( y >= 85 && y < 100 ) y += 1900;
  
  if ( y < 1985 || y > 3000 )
    Helper::halt( "invalid year (range 1985 - 3000): " + Helper::int2str(y) );
  
  if ( m < 1 || m > 12 )
    Helper::halt( "invalid month (range 1 - 12): " + Helper::int2str(m) );
  
  if ( d < 1 || d > days_in_month( m , y ) )
    Helper::halt( "invalid day (range 1 - [28-31]): " + Helper::int2str(d) );
}

int date_t::count( const date_t & dt ) 
{
  
  int days = 0;
  
  // count up until the final year
  for ( int y1 = 1985 ; y1 < dt.y ; y1++ )
    days += leap_year( y1 ) ? 366 : 365 ;

  // count up until the final month
  for ( int m1 = 1 ; m1 < dt.m ; m1++ )
    days += days_in_month( m1 , dt.y );

  // count final days in last month
  days += dt.d;
  
  // 0-based count, i.e. 1/1/85 == 0
  return days - 1 ;
    
}


//
// clocktime_t
//

clocktime_t::clocktime_t( const std::string & t )
{
  parse_string( t );
}

void clocktime_t::parse_string( const std::string & t )
{
  valid = false;
  d = h = m = 0;
  s = 0;
  
  // a date part is separated from the time by a space or 'T'
  std::string t1 = Helper::lrtrim( t );
  if ( t1.size() > 0 && t1[ t1.size() - 1 ] == 'Z' ) t1 = t1.substr( 0 , t1.size() - 1 );
  std::string::size_type sep = t1.find_first_of( " T" );

  if ( sep == std::string::npos )
    {
      valid = Helper::timestring( t1 , &h, &m, &s );
    }
  else
    {
      const std::string dt = t1.substr( 0 , sep );
      if ( ! date_t::is_valid( dt ) ) return;
      d = date_t::count( date_t( dt ) );
      valid = Helper::timestring( Helper::lrtrim( t1.substr( sep + 1 ) ) , &h, &m, &s );
    }

  if ( h < 0 || m < 0 || s < 0 ) valid = false;
  if ( h > 23 || m > 59 || s >= 60.0 ) valid = false;
}

double clocktime_t::seconds( const int dr ) const
{
  return (double)(d-dr)*24.0*60.0*60.0 + h*60.0*60.0 + m*60.0 + s ;
}

