
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

#include "helper/helper.h"

#include <stdexcept>

TEST(Helper,numericParsing)
{
  double d = 0;
  EXPECT_TRUE( Helper::str2dbl( "12.5" , &d ) );
  EXPECT_DOUBLE_EQ( 12.5 , d );
  EXPECT_FALSE( Helper::str2dbl( "12abc" , &d ) ) << "trailing junk is not a number";
  EXPECT_FALSE( Helper::str2dbl( "12:30:00" , &d ) );
  EXPECT_FALSE( Helper::str2dbl( "" , &d ) );

  int i = 0;
  EXPECT_TRUE( Helper::str2int( "08" , &i ) );
  EXPECT_EQ( 8 , i );
  EXPECT_FALSE( Helper::str2int( "1.5" , &i ) );
}

TEST(Helper,parsing)
{
  std::vector<std::string> tok = Helper::parse( "a,b,,c" , "," );
  ASSERT_EQ( 3u , tok.size() );
  EXPECT_EQ( "c" , tok[2] );

  // quoted delimiters are kept
  tok = Helper::quoted_parse( "\"1,5\";2" , ';' );
  ASSERT_EQ( 2u , tok.size() );
  EXPECT_EQ( "1,5" , Helper::unquote( tok[0] ) );

  EXPECT_EQ( "x y" , Helper::lrtrim( "  x y \t" ) );
  EXPECT_TRUE( Helper::iequals( "Power" , "POWER" ) );
  EXPECT_TRUE( Helper::yesno( "T" ) );
  EXPECT_FALSE( Helper::yesno( "0" ) );
}

TEST(Helper,clocktimes)
{
  clocktime_t t1( "12:30:15.5" );
  ASSERT_TRUE( t1.valid );
  EXPECT_EQ( 12 , t1.h );
  EXPECT_EQ( 30 , t1.m );
  EXPECT_DOUBLE_EQ( 15.5 , t1.s );
  EXPECT_EQ( 0 , t1.d );

  clocktime_t t2( "2024-03-01 00:00:10" );
  clocktime_t t3( "2024-02-29T23:59:50Z" );
  ASSERT_TRUE( t2.valid );
  ASSERT_TRUE( t3.valid );
  EXPECT_NEAR( 20.0 , t2.seconds() - t3.seconds() , 1e-9 ) << "leap day to 1 March";

  EXPECT_FALSE( clocktime_t( "25:00:00" ).valid );
  EXPECT_FALSE( clocktime_t( "2023-02-29 10:00:00" ).valid );
  EXPECT_FALSE( clocktime_t( "power" ).valid );

  EXPECT_EQ( "08:05:03" , Helper::timestring( 8 , 5 , 3.2 ) );
}

TEST(Helper,dates)
{
  EXPECT_TRUE( date_t::is_valid( "01-03-2024" ) );
  EXPECT_TRUE( date_t::is_valid( "2024/03/01" ) );
  EXPECT_FALSE( date_t::is_valid( "31-04-2024" ) );
  EXPECT_EQ( date_t::count( date_t( "2024-03-01" ) ) , date_t::count( date_t( "01.03.2024" ) ) );
  EXPECT_EQ( 0 , date_t::count( date_t( 1 , 1 , 1985 ) ) );
  EXPECT_THROW( date_t( "2024-13-01" ) , std::runtime_error );
}

TEST(Helper,haltUsesBailFunction)
{
  EXPECT_THROW( Helper::halt( "stop here" ) , std::runtime_error );
}
