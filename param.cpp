
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

#include "param.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <fstream>

extern logger_t logger;


void param_t::add( const std::string & option , const std::string & value ) 
{
  // set key=value pairs to opt[]

  if ( option == "" ) return;
  
  // key+=value appends to any existing comma-delimited list
  
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

  // else check no doubles unless in API mode
  if ( ! globals::api_mode ) 
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
  std::vector<std::string> tok = Helper::quoted_parse( s , "=" );
  if ( tok.size() == 2 )     add( tok[0] , tok[1] );
  else if ( tok.size() == 1 ) add( tok[0] , "__null__" );
  else // ignore subsequent '=' signs in 'value'  (i.e. key=value=2  is 'okay', means "value=2" is set to 'key')
    {
      std::string v = tok[1];
      for (int i=2;i<tok.size();i++) v += "=" + tok[i];
      add( tok[0] , v );
    }
}


void param_t::read( const std::string & filename )
{

  const std::string f = Helper::expand( filename );
  
  if ( ! Helper::fileExists( f ) )
    Helper::halt( "could not find parameter file " + f );
  
  std::ifstream IN1( f.c_str() , std::ios::in );

  int cnt = 0;
  
  while ( ! IN1.eof() )
    {
      std::string line;
      Helper::safe_getline( IN1 , line );
      if ( IN1.eof() && line == "" ) break;

      // strip comments
      std::string::size_type pc = line.find( "%" );
      if ( pc != std::string::npos ) line = line.substr( 0 , pc );
      
      std::vector<std::string> tok = Helper::quoted_parse( Helper::lrtrim( line ) , "\t" );
      if ( tok.size() == 1 ) tok = Helper::quoted_parse( Helper::lrtrim( line ) , " " );

      for (int i=0; i<tok.size(); i++)
	{
	  const std::string t = Helper::lrtrim( tok[i] );
	  if ( t == "" ) continue;
	  parse( t );
	  ++cnt;
	}
    }

  IN1.close();

  logger << "  read " << cnt << " parameter(s) from " << f << "\n";
  
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
  // a bare flag ('key') means yes
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

std::string param_t::take( const std::string & s , const std::string & def )
{
  if ( ! has( s ) ) return def;
  const std::string v = empty( s ) ? def : value( s );
  opt.erase( s );
  return v;
}

int param_t::requires_int( const std::string & s ) const
{
  if ( ! has(s) ) Helper::halt( "invalid configuration: missing parameter " + s );
  int r = 0;
  if ( ! Helper::str2int( value(s) , &r ) ) 
    Helper::halt( "invalid configuration: " + s + " requires an integer value, not '" + value(s) + "'" );
  return r;
}

double param_t::requires_dbl( const std::string & s ) const
{
  if ( ! has(s) ) Helper::halt( "invalid configuration: missing parameter " + s );
  double r = 0;
  if ( ! Helper::str2dbl( value(s) , &r ) ) 
    Helper::halt( "invalid configuration: " + s + " requires a numeric value, not '" + value(s) + "'" );
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
  std::vector<std::string> tok = Helper::quoted_parse( value(k) , delim );
  for (int i=0;i<tok.size();i++) 
    {
      std::string str = Helper::unquote( tok[i]);
      double d = 0;
      if ( ! Helper::str2dbl( str , &d ) )
	Helper::halt( "invalid configuration: bad " + k + " value '" + str + "'" );
      s.push_back(d); 
    }
  return s;
}

std::set<std::string> param_t::keys() const
{
  std::set<std::string> s;
  std::map<std::string,std::string>::const_iterator ii = opt.begin();
  while ( ii != opt.end() )
    {
      s.insert( ii->first );
      ++ii;
    }
  return s;
}
