
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

#include "db/db.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <ctime>

extern logger_t logger;


std::string strata_t::print() const
{
  if ( levels.size() == 0 ) return ".";
  std::stringstream ss;
  std::map<int,std::pair<std::string,std::string> >::const_iterator aa = levels.begin();
  while ( aa != levels.end() )
    {
      if ( aa != levels.begin() ) ss << ";";
      ss << aa->second.first << "/" << aa->second.second ; 
      ++aa;
    }
  return ss.str();
}

std::string strata_t::factor_string() const
{
  if ( levels.size() == 0 ) return ".";
  std::stringstream ss;
  std::map<int,std::pair<std::string,std::string> >::const_iterator aa = levels.begin();
  while ( aa != levels.end() )
    {
      if ( aa != levels.begin() ) ss << "_";
      ss << aa->second.first;
      ++aa;
    }
  return ss.str();
}


bool writer_t::attach( const std::string & filename )
{

  close();
  
  db.open( filename );

  dbless = false;
  
  db.synchronous( false );
  
  db.query(" CREATE TABLE IF NOT EXISTS individuals("
	   "   indiv_id    INTEGER PRIMARY KEY , "
	   "   indiv_name  VARCHAR(20) NOT NULL , "
	   "   file_name   VARCHAR(20) ); " ); 
  
  db.query(" CREATE TABLE IF NOT EXISTS commands("
	   "   cmd_id          INTEGER PRIMARY KEY , "
	   "   cmd_name        VARCHAR(20) NOT NULL , "
	   "   cmd_number      INTEGER NOT NULL , "
	   "   cmd_timestamp   VARCHAR(20) NOT NULL , "
	   "   cmd_parameters  VARCHAR(20)  ); " ); 

  db.query(" CREATE TABLE IF NOT EXISTS variables("
	   "   variable_id    INTEGER PRIMARY KEY , "
	   "   variable_name  VARCHAR(20) NOT NULL , "
	   "   command_name   VARCHAR(20) ); " ); 

  // a specific combination of factor levels
  db.query(" CREATE TABLE IF NOT EXISTS strata("
	   "   strata_id    INTEGER PRIMARY KEY , "
	   "   factors      VARCHAR(20) NOT NULL , "
	   "   levels       VARCHAR(20) NOT NULL ); " );
  
  db.query(" CREATE TABLE IF NOT EXISTS datapoints("
	   "   indiv_id      INTEGER NOT NULL , "
	   "   cmd_id        INTEGER NOT NULL , "
	   "   variable_id   INTEGER NOT NULL , "	    
	   "   strata_id     INTEGER , "
	   "   value         NUMERIC ); " );

  db.prepare( "INSERT INTO individuals ( indiv_name , file_name ) values( :indiv_name , :file_name ); " , "insert_indiv" );
  db.prepare( "INSERT INTO commands ( cmd_name , cmd_number , cmd_timestamp , cmd_parameters ) "
	      " values( :cmd_name , :cmd_number , :cmd_timestamp , :cmd_parameters ); " , "insert_cmd" );
  db.prepare( "INSERT INTO variables ( variable_name , command_name ) values( :variable_name , :command_name ); " , "insert_var" );
  db.prepare( "INSERT INTO strata ( factors , levels ) values( :factors , :levels ); " , "insert_strata" );
  db.prepare( "INSERT INTO datapoints ( indiv_id , cmd_id , variable_id , strata_id , value ) "
	      " values( :indiv_id , :cmd_id , :variable_id , :strata_id , :value ); " , "insert_value" );
  
  return db.is_open();
}


bool writer_t::close() 
{
  curr_strata.clear();
  factors.clear();
  idmap.clear();
  curr_indiv = curr_command = curr_file = "";
  curr_indiv_id = curr_cmd_id = -1;
  
  if ( dbless ) return false;
  db.close();
  dbless = true;
  return true;
}


bool writer_t::id( const std::string & indiv_name , const std::string & file_name )
{

  curr_indiv = indiv_name;
  curr_file = file_name;
  
  if ( dbless ) return true;

  const std::string key = "indiv:" + indiv_name;
  if ( idmap.find( key ) != idmap.end() )
    {
      curr_indiv_id = idmap[ key ];
      return true;
    }
  
  sqlite3_stmt * s = db.fetch_prepared( "insert_indiv" );
  db.bind_text( s , ":indiv_name" , indiv_name );
  db.bind_text( s , ":file_name" , file_name );
  db.step( s );
  db.reset( s );
  
  curr_indiv_id = idmap[ key ] = db.last_insert_rowid();
  return true;
}


bool writer_t::cmd( const std::string & cmd_name , const int cmd_number , const std::string & param )
{

  curr_command = cmd_name;

  // a new command starts with a clean stratification
  curr_strata.clear();
  
  if ( dbless ) return true;

  const std::string key = "cmd:" + cmd_name + "." + Helper::int2str( cmd_number );
  if ( idmap.find( key ) != idmap.end() )
    {
      curr_cmd_id = idmap[ key ];
      return true;
    }
  
  time_t rawtime;
  time (&rawtime);
  char BUFFER[50];
  strftime(BUFFER, sizeof(BUFFER), "%d-%b-%Y %H:%M:%S", localtime(&rawtime) ); 
  
  sqlite3_stmt * s = db.fetch_prepared( "insert_cmd" );
  db.bind_text( s , ":cmd_name" , cmd_name );
  db.bind_int( s , ":cmd_number" , cmd_number );
  db.bind_text( s , ":cmd_timestamp" , BUFFER );
  db.bind_text( s , ":cmd_parameters" , param );
  db.step( s );
  db.reset( s );

  curr_cmd_id = idmap[ key ] = db.last_insert_rowid();
  return true;
}


bool writer_t::level( const std::string & level_name , const std::string & factor_name )
{
  // factors are ordered by first use
  if ( factors.find( factor_name ) == factors.end() )
    {
      const int n = factors.size();
      factors[ factor_name ] = n;
    }
  
  curr_strata.insert( factors[ factor_name ] , factor_name , level_name );
  return true;
}


bool writer_t::unlevel( const std::string & factor_name )
{
  // never added / no need to drop
  if ( factors.find( factor_name ) == factors.end() ) return false;
  curr_strata.drop( factors[ factor_name ] );
  return true;
}


bool writer_t::value( const std::string & var_name , const value_t & x )
{

  if ( dbless ) return to_stdout( var_name , x );

  // variable ID ('command:var' is the unique key)
  
  const std::string var_key = "var:" + curr_command + ":" + var_name;

  if ( idmap.find( var_key ) == idmap.end() )
    {
      sqlite3_stmt * s = db.fetch_prepared( "insert_var" );
      db.bind_text( s , ":variable_name" , var_name );
      db.bind_text( s , ":command_name" , curr_command );
      db.step( s );
      db.reset( s );
      idmap[ var_key ] = db.last_insert_rowid();
    }

  // strata ID

  int strata_id = -1;

  if ( ! curr_strata.empty() )
    {
      const std::string strata_key = "strata:" + curr_strata.print();
      if ( idmap.find( strata_key ) == idmap.end() )
	{
	  sqlite3_stmt * s = db.fetch_prepared( "insert_strata" );
	  db.bind_text( s , ":factors" , curr_strata.factor_string() );
	  db.bind_text( s , ":levels" , curr_strata.print() );
	  db.step( s );
	  db.reset( s );
	  idmap[ strata_key ] = db.last_insert_rowid();
	}
      strata_id = idmap[ strata_key ];
    }
  
  sqlite3_stmt * s = db.fetch_prepared( "insert_value" );
  db.bind_int( s , ":indiv_id" , curr_indiv_id );
  db.bind_int( s , ":cmd_id" , curr_cmd_id );
  db.bind_int( s , ":variable_id" , idmap[ var_key ] );
  
  if ( strata_id == -1 ) db.bind_null( s , ":strata_id" );
  else db.bind_int( s , ":strata_id" , strata_id );

  if ( x.is_missing() ) db.bind_null( s , ":value" );
  else if ( x.is_numeric() ) db.bind_double( s , ":value" , x.d );
  else if ( x.is_integer() ) db.bind_int( s , ":value" , x.i );
  else db.bind_text( s , ":value" , x.s );
  
  db.step( s );
  db.reset( s );
  
  return true;
}

