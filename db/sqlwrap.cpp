
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

#include "db/sqlwrap.h"
#include "helper/helper.h"

bool SQL::open(std::string n)
{

  // expand ~ to home folder...
  name = Helper::expand( n ) ;
  
  rc = sqlite3_open( name.c_str() , &db);
  
  if ( rc ) Helper::halt("problem opening database: " + name );

  return rc == 0;
}

void SQL::synchronous(bool b)
{
  if ( !b ) 
    query( "PRAGMA synchronous=0;" ); // OFF
  else
    query( "PRAGMA synchronous=2;" ); // FULL
}

void SQL::close()
{
  if ( db ) 
    {
      // any statements still prepared must be finalized first
      std::set<sqlite3_stmt*>::iterator ii = qset.begin();
      while ( ii != qset.end() )
	{
	  sqlite3_finalize( *ii );
	  ++ii;
	}
      qset.clear();
      qmap.clear();
      
      sqlite3_close(db);	    
      db = NULL;
    }
}

bool SQL::query( const std::string & q )
{  
  char * db_err = NULL;
  rc = sqlite3_exec( db , q.c_str() , 0 , 0 , &db_err );
  if ( rc ) 
    {
      Helper::warn( db_err != NULL ? std::string(db_err) : "query failed: " + q );
      sqlite3_free( db_err );
    }
  return rc == 0;
}

sqlite3_stmt * SQL::prepare( const std::string & q )
{   
  sqlite3_stmt * p;
  int rc = sqlite3_prepare_v2( db , q.c_str() , q.size() , &p , NULL );   
  if ( rc ) Helper::warn( "preparing query " + std::string( sqlite3_errmsg(db) ) );
  else qset.insert(p);
  return rc ? NULL : p;
}

sqlite3_stmt * SQL::prepare( const std::string & q, const std::string & key )
{   
  sqlite3_stmt * p;
  int rc = sqlite3_prepare_v2( db , q.c_str() , q.size() , &p , NULL );   
  if ( rc ) Helper::halt( "preparing query " + std::string( sqlite3_errmsg(db) ) );
  qset.insert( p );
  qmap[ key ] = p;
  return p;
}

sqlite3_stmt * SQL::fetch_prepared( const std::string & key )
{
  std::map<std::string,sqlite3_stmt*>::iterator i = qmap.find(key);
  if ( i == qmap.end() ) return NULL;
  return i->second;
}

void SQL::begin()
{  
  char * db_err = NULL;
  rc = sqlite3_exec( db , "BEGIN;" , 0 , 0 , &db_err );
  if ( rc ) 
    {
      const std::string msg = db_err != NULL ? db_err : "could not begin transaction";
      sqlite3_free( db_err );
      Helper::halt( msg );
    }
}

void SQL::commit()
{
  query( "COMMIT;" );
}

void SQL::finalise(sqlite3_stmt * stmt)
{
  std::set<sqlite3_stmt*>::iterator i = qset.find( stmt );
  if ( stmt && i != qset.end() ) 
    {
      qset.erase( i ); 
      sqlite3_finalize( stmt );  
    }
}

bool SQL::step(sqlite3_stmt * stmt)
{
  
  rc = sqlite3_step( stmt );

  if ( rc != SQLITE_ROW && rc != SQLITE_DONE )
    {
      reset(stmt);
      Helper::halt( "database (" + name +") error (" + Helper::int2str( sqlite3_errcode(db) ) +") " + sqlite3_errmsg(db) );
    }
  
  return rc == SQLITE_ROW;
}

void SQL::reset( sqlite3_stmt * stmt )
{
  sqlite3_reset( stmt );
}

void SQL::bind_int( sqlite3_stmt * stmt , const std::string index , int value )
{
  sqlite3_bind_int( stmt , 
		     sqlite3_bind_parameter_index( stmt , index.c_str() ) ,
		     value );
}

void SQL::bind_null( sqlite3_stmt * stmt , const std::string index  )
{
    sqlite3_bind_null( stmt , 
		       sqlite3_bind_parameter_index( stmt , index.c_str() ) );
}

void SQL::bind_double( sqlite3_stmt * stmt , const std::string index , double value )
{
  sqlite3_bind_double( stmt , 
		     sqlite3_bind_parameter_index( stmt , index.c_str() ) ,
		     value );
}

void SQL::bind_text( sqlite3_stmt * stmt , const std::string index , const std::string & value )
{
  sqlite3_bind_text( stmt , 
		     sqlite3_bind_parameter_index( stmt , index.c_str() ) ,
		     value.c_str() , 
		     value.size() , 
		     SQLITE_TRANSIENT );
}

