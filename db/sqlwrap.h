
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

#ifndef __PWRUSE_SQLWRAP_H__
#define __PWRUSE_SQLWRAP_H__

#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <stdint.h>

#include <sqlite3.h>


class SQL {

 public:

    SQL() {
      db = NULL;
      name = "";
    }

    ~SQL() { close(); }
    
  bool open(std::string n);
  void synchronous(bool);
  void close();
  bool is_open() const { return db; }
  std::string filename() const { return name; }
  bool query( const std::string & q);

  sqlite3_stmt * prepare(const std::string & q);
  sqlite3_stmt * prepare(const std::string & q, const std::string & key);
  sqlite3_stmt * fetch_prepared(const std::string & key);

  bool step(sqlite3_stmt * stmt);
  void reset( sqlite3_stmt * stmt );
  void finalise(sqlite3_stmt * stmt);

  void begin();
  void commit();

  uint64_t last_insert_rowid()
    { return sqlite3_last_insert_rowid(db); }
  
  void bind_int( sqlite3_stmt * stmt , const std::string index , int value );
  void bind_double( sqlite3_stmt * stmt , const std::string index , double value );
  void bind_text( sqlite3_stmt * stmt , const std::string index , const std::string & value );
  void bind_null( sqlite3_stmt * stmt , const std::string index );

    
  
 private:
  
  // Keep track of all prepared statements
  std::set<sqlite3_stmt*> qset;
  
  // Map of prepared statements
  std::map<std::string,sqlite3_stmt*> qmap;
  
  // Database
  sqlite3 * db;
  
  // Return code
  int rc;

  // Name of database
  std::string name;
 
};

#endif
