
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

#include "series/series.h"
#include "helper/helper.h"
#include "fixtures.h"

#include <stdexcept>

TEST(PowerSeries,setValidates)
{
  power_series_t s;
  std::vector<double> t, x;
  EXPECT_THROW( s.set( t , x ) , std::runtime_error ) << "empty series";

  t.push_back( 0 ); t.push_back( 1 ); t.push_back( 1 );
  x.resize( 3 , 5 );
  EXPECT_THROW( s.set( t , x ) , std::runtime_error ) << "repeated time-point";

  t[2] = 0.5;
  EXPECT_THROW( s.set( t , x ) , std::runtime_error ) << "decreasing time-point";
  
  x.resize( 2 );
  EXPECT_THROW( s.set( t , x ) , std::runtime_error ) << "length mismatch";
}

TEST(PowerSeries,errorMessagePrefix)
{
  power_series_t s;
  try 
    {
      s.set( std::vector<double>() , std::vector<double>() );
      FAIL() << "expected an input error";
    }
  catch ( const std::runtime_error & e )
    {
      EXPECT_EQ( 0u , std::string( e.what() ).find( "invalid input:" ) );
    }
}

TEST(PowerSeries,loadCommaSeconds)
{
  const std::string f = "pwruse-test-comma.csv";
  fixtures::write_file( f , 
			"timestamp,power,voltage\n"
			"0.0,10,230\n"
			"0.1,12.5,230\n"
			"0.2,11,229\n"
			"0.3,10,230\n" );

  power_series_t s;
  s.load( f );
  Helper::deleteFile( f );

  ASSERT_EQ( 4 , s.size() );
  EXPECT_EQ( ',' , s.delim );
  EXPECT_DOUBLE_EQ( 12.5 , s.x[1] );
  EXPECT_EQ( "0.2" , s.labels[2] );
  EXPECT_NEAR( 0.3 , s.elapsed( 3 ) , 1e-12 );

  bool uniform = false;
  EXPECT_NEAR( 10.0 , s.estimate_fs( &uniform ) , 1e-9 );
  EXPECT_TRUE( uniform );
}

TEST(PowerSeries,loadByteOrderMark)
{
  const std::string f = "pwruse-test-bom.csv";
  fixtures::write_file( f , 
			"\xEF\xBB\xBFtimestamp,power,temp\xC3\xA9rature \xC2\xB0" "C\n"
			"0.0,10,21\n"
			"0.5,20,21\n"
			"1.0,30,22\n" );

  power_series_t s;
  s.load( f );
  Helper::deleteFile( f );

  ASSERT_EQ( 3 , s.size() );
  EXPECT_EQ( "0.0" , s.labels[0] );
  EXPECT_DOUBLE_EQ( 30.0 , s.x[2] );
  EXPECT_NEAR( 2.0 , s.estimate_fs() , 1e-9 );

  EXPECT_EQ( "\xC2\xB0" "C" , Helper::lrtrim( " \xC2\xB0" "C " ) );
  EXPECT_EQ( "TEMP\xC3\xA9" , Helper::toupper( "temp\xC3\xA9" ) );
}

TEST(PowerSeries,loadSemicolonDates)
{
  const std::string f = "pwruse-test-semicolon.csv";
  fixtures::write_file( f , 
			"Time;Watts\r\n"
			"2024-03-01 10:00:00;1\r\n"
			"2024-03-01 10:00:01;2\r\n"
			"2024-03-01T10:00:03;3\r\n" );

  power_series_t s;
  s.load( f , "time" , "watts" );
  Helper::deleteFile( f );

  ASSERT_EQ( 3 , s.size() );
  EXPECT_EQ( ';' , s.delim );
  EXPECT_TRUE( s.has_dates );
  EXPECT_NEAR( 3.0 , s.elapsed( 2 ) , 1e-9 );
  EXPECT_EQ( "2024-03-01 10:00:01" , s.labels[1] );

  bool uniform = true;
  EXPECT_NEAR( 2.0 / 3.0 , s.estimate_fs( &uniform ) , 1e-9 );
  EXPECT_FALSE( uniform ) << "1 s then 2 s spacing";
}

TEST(PowerSeries,loadTabClockMidnight)
{
  const std::string f = "pwruse-test-tab.txt";
  fixtures::write_file( f , 
			"timestamp\tpower\n"
			"23:59:58\t1\n"
			"23:59:59\t1\n"
			"00:00:00\t1\n"
			"00:00:01\t1" );

  power_series_t s;
  s.load( f );
  Helper::deleteFile( f );

  ASSERT_EQ( 4 , s.size() ) << "last line without a newline";
  EXPECT_EQ( '\t' , s.delim );
  EXPECT_FALSE( s.has_dates );
  EXPECT_NEAR( 3.0 , s.elapsed( 3 ) , 1e-9 );
}

TEST(PowerSeries,loadErrors)
{
  power_series_t s;

  EXPECT_THROW( s.load( "pwruse-no-such-file.csv" ) , std::runtime_error );

  const std::string f = "pwruse-test-bad.csv";

  fixtures::write_file( f , "time,power\n0,1\n1,2\n" );
  EXPECT_THROW( s.load( f ) , std::runtime_error ) << "no 'timestamp' column";
  
  fixtures::write_file( f , "timestamp,power\n0,1\n1,abc\n" );
  EXPECT_THROW( s.load( f ) , std::runtime_error ) << "bad power value";

  fixtures::write_file( f , "timestamp,power\n0,1\n1,2,3\n" );
  EXPECT_THROW( s.load( f ) , std::runtime_error ) << "ragged row";

  fixtures::write_file( f , "timestamp,power\n0,1\n10:00:00,2\n" );
  EXPECT_THROW( s.load( f ) , std::runtime_error ) << "mixed time formats";

  fixtures::write_file( f , "timestamp,power\n" );
  EXPECT_THROW( s.load( f ) , std::runtime_error ) << "no samples";

  fixtures::write_file( f , "timestamp,power\n0,1\n2,1\n1,1\n" );
  EXPECT_THROW( s.load( f ) , std::runtime_error ) << "non-increasing time-points";

  Helper::deleteFile( f );
}
