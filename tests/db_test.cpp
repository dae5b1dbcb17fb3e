
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


#include <gtest/gtest.h>

#include "db/db.h"
#include "db/sqlwrap.h"
#include "helper/helper.h"

#include <sstream>

static std::string column_text( sqlite3_stmt * s , int idx )
{
  const unsigned char * t = sqlite3_column_text( s , idx );
  return t == NULL ? "" : (const char*)t;
}

TEST(Writer,stratifiedRows)
{
  std::stringstream ss;

  writer_t w;
  w.nodb( &ss );
  EXPECT_TRUE( w.is_dbless() );
  EXPECT_EQ( "." , w.name() );
  
  w.id( "dev1" , "dev1.csv" );
  w.cmd( "USAGE" , 1 , "th=2" );
  w.value( "N" , 3 );
  w.level( 1 , "E" );
  w.level( "START" , "TYPE" );
  w.value( "SP" , 500 );
  w.unlevel( "TYPE" );
  w.value( "SEC" , 1.5 );
  w.unlevel();
  w.missing_value( "DUR" );
  EXPECT_FALSE( w.unlevel( "EP" ) ) << "never declared";

  std::vector<std::string> lines;
  std::string line;
  while ( std::getline( ss , line ) ) lines.push_back( line );

  ASSERT_EQ( 4u , lines.size() );
  EXPECT_EQ( "dev1\tUSAGE\t.\tN\t3" , lines[0] );
  EXPECT_EQ( "dev1\tUSAGE\tE/1;TYPE/START\tSP\t500" , lines[1] );
  EXPECT_EQ( "dev1\tUSAGE\tE/1\tSEC\t1.5" , lines[2] );
  EXPECT_EQ( "dev1\tUSAGE\t.\tDUR\tNA" , lines[3] );
}

TEST(Writer,strataOrder)
{
  strata_t s;
  EXPECT_EQ( "." , s.print() );
  s.insert( 1 , "TYPE" , "STOP" );
  s.insert( 0 , "E" , "2" );
  EXPECT_EQ( "E/2;TYPE/STOP" , s.print() );
  EXPECT_EQ( "E_TYPE" , s.factor_string() );
  s.drop( 0 );
  EXPECT_EQ( "TYPE/STOP" , s.print() );
}

TEST(Writer,sqliteDatabase)
{
  const std::string f = "pwruse-test-out.db";
  Helper::deleteFile( f );

  {
    writer_t w;
    ASSERT_TRUE( w.attach( f ) );
    EXPECT_FALSE( w.is_dbless() );
    EXPECT_EQ( f , w.name() );
    
    w.begin();
    w.id( "dev1" , "dev1.csv" );
    w.cmd( "USAGE" , 1 , "" );
    w.value( "N_EVENTS" , 2 );
    w.level( 1 , "E" );
    w.value( "TYPE" , "START" );
    w.value( "SEC" , 50.0 );
    w.level( 2 , "E" );
    w.value( "TYPE" , "STOP" );
    w.unlevel( "E" );
    w.missing_value( "STEP" );
    w.commit();
    w.close();
    EXPECT_TRUE( w.is_dbless() );
  }

  SQL db;
  db.open( f );
  ASSERT_TRUE( db.is_open() );
  sqlite3_stmt * s = db.prepare( "SELECT COUNT(*) FROM sqlite_master WHERE type='table';" );
  ASSERT_TRUE( s != NULL );
  ASSERT_TRUE( db.step( s ) );
  EXPECT_EQ( 5 , sqlite3_column_int( s , 0 ) ) << "individuals commands variables strata datapoints";
  db.finalise( s );

  s = db.prepare( "SELECT COUNT(*) FROM datapoints;" );
  ASSERT_TRUE( s != NULL );
  ASSERT_TRUE( db.step( s ) );
  EXPECT_EQ( 5 , sqlite3_column_int( s , 0 ) );
  db.finalise( s );

  s = db.prepare( "SELECT COUNT(*) FROM variables;" );
  ASSERT_TRUE( db.step( s ) );
  EXPECT_EQ( 4 , sqlite3_column_int( s , 0 ) ) << "TYPE is stored once";
  db.finalise( s );

  s = db.prepare( "SELECT levels FROM strata ORDER BY strata_id;" );
  ASSERT_TRUE( db.step( s ) );
  EXPECT_EQ( "E/1" , column_text( s , 0 ) );
  ASSERT_TRUE( db.step( s ) );
  EXPECT_EQ( "E/2" , column_text( s , 0 ) );
  EXPECT_FALSE( db.step( s ) );
  db.finalise( s );

  s = db.prepare( "SELECT COUNT(*) FROM datapoints WHERE value IS NULL;" );
  ASSERT_TRUE( db.step( s ) );
  EXPECT_EQ( 1 , sqlite3_column_int( s , 0 ) );
  db.finalise( s );

  s = db.prepare( "SELECT indiv_name FROM individuals;" );
  ASSERT_TRUE( db.step( s ) );
  EXPECT_EQ( "dev1" , column_text( s , 0 ) );
  db.finalise( s );
  
  db.close();
  Helper::deleteFile( f );
}
