
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

#ifndef __PWRUSE_DB_H__
#define __PWRUSE_DB_H__

#include "db/sqlwrap.h"
#include "helper/helper.h"

#include <string>
#include <map>
#include <vector>
#include <sstream>
#include <iostream>

class writer_t;
extern writer_t writer;


struct value_t
{ 
  value_t( const std::string & s ) : numeric(false) , integer(false), missing( false ) , s(s) { } 
  value_t( double d ) : numeric(true) , integer(false) , missing( false ), d(d) { } 
  value_t( int i ) : numeric(false) , integer(true) , missing(false) , i(i) { } 
  value_t() : numeric(false) , integer(false) , missing(true) { } 

  // numeric   integer   missing
  // T         F         F             double
  // F         T         F             int
  // F         F         F             string
  // F         F         T             missing
  
  bool is_string() const { return ! ( numeric || integer || missing ); } 
  bool is_numeric() const { return numeric; } 
  bool is_integer() const { return integer; } 
  bool is_missing() const { return missing; }

  std::string str() const 
  {
    std::stringstream ss;
    if ( missing ) ss << "NA";    
    else if ( numeric ) ss << d;
    else if ( integer ) ss << i;
    else ss << s;
    return ss.str();
  }

  bool numeric;
  bool integer;
  bool missing;
  
  std::string s;
  double d;
  int i;
  
};


//
// current stratification: one level per factor, factors kept in
// the order they were first declared
//

struct strata_t
{
  
  void clear() { levels.clear(); }

  bool empty() const { return levels.size() == 0; } 

  void insert( const int factor_order , const std::string & factor , const std::string & level ) 
  { levels[ factor_order ] = std::make_pair( factor , level ); }

  void drop( const int factor_order ) { levels.erase( factor_order ); }
  
  // e.g. E/3;TYPE/START
  std::string print() const;

  // e.g. E_TYPE 
  std::string factor_string() const;
  
  std::map<int,std::pair<std::string,std::string> > levels;
  
};


//
// stratified output: to stdout (default) or an attached sqlite database
//

class writer_t 
{
  
 public:

  writer_t() { dbless = true; out = &std::cout; curr_indiv_id = curr_cmd_id = -1; } 

  ~writer_t() { close(); } 
  
  bool attach( const std::string & filename );
  
  void nodb( std::ostream * s = &std::cout ) 
  { 
    close();
    dbless = true; 
    out = s;
  } 
  
  bool close();

  std::string name() const { return dbless ? "." : db.filename(); } 

  bool is_dbless() const { return dbless; }
  
  void begin() { if ( ! dbless ) db.begin(); } 
  
  void commit() { if ( ! dbless ) db.commit(); }

  
  //
  // writers
  //
  
  // Current command
  
  bool cmd( const std::string & cmd_name , const int cmd_number , const std::string & param );

  // Current individual

  bool id( const std::string & indiv_name , const std::string & file_name );

  // Current factor/level
  
  bool level( const int level_name , const std::string & factor_name )
  {
    return level( Helper::int2str( level_name ) , factor_name );
  }

  bool level( const double level_name , const std::string & factor_name )
  {
    return level( Helper::dbl2str( level_name ) , factor_name );
  }
  
  bool level( const std::string & level_name , const std::string & factor_name );
  
  bool unlevel( const std::string & factor_name );
  
  bool unlevel() 
  {
    curr_strata.clear();
    return true;
  }

  
  //
  // Value (to DB or stdout)
  //

  bool value( const std::string & var_name , double d )
  {    
    return value( var_name , value_t( d ) ) ;
  }

  bool value( const std::string & var_name , int i ) 
  { 
    return value( var_name , value_t( i ) ) ; 
  } 
  
  bool value( const std::string & var_name , const std::string & s )
  {
    return value( var_name , value_t( s ) ) ;
  }

  bool value( const std::string & var_name , const char * s )
  {
    return value( var_name , value_t( std::string( s ) ) ) ;
  }
  
  bool missing_value( const std::string & var_name )
  {
    return value( var_name , value_t() );
  }

  bool value( const std::string & var_name , const value_t & x );

  
 private:

  bool to_stdout( const std::string & var_name , const value_t & x )  
  {
    *out << curr_indiv << "\t"
	 << curr_command 
	 << "\t" << curr_strata.print()
	 << "\t" << var_name 
	 << "\t" << x.str() 
	 << "\n";
    return true;
  }

  bool dbless;

  std::ostream * out;
  
  SQL db;

  std::string curr_indiv;

  std::string curr_file;
  
  std::string curr_command;

  int curr_indiv_id;

  int curr_cmd_id;
  
  strata_t curr_strata;

  // factor name --> declaration order
  std::map<std::string,int> factors;

  // cached row IDs (variables, strata) for the attached database
  std::map<std::string,int> idmap;
  
};


#endif
