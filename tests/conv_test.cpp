
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

#include "dsp/conv.h"

#include <stdexcept>

TEST(Convolution,full)
{
  std::vector<double> s , k;
  s.push_back( 1 ); s.push_back( 2 ); s.push_back( 3 );
  k.push_back( 0 ); k.push_back( 1 ); k.push_back( 0.5 );

  std::vector<double> r = dsptools::convolve( s , k );
  ASSERT_EQ( 5u , r.size() );
  EXPECT_DOUBLE_EQ( 0.0 , r[0] );
  EXPECT_DOUBLE_EQ( 1.0 , r[1] );
  EXPECT_DOUBLE_EQ( 2.5 , r[2] );
  EXPECT_DOUBLE_EQ( 4.0 , r[3] );
  EXPECT_DOUBLE_EQ( 1.5 , r[4] );

  EXPECT_EQ( 0u , dsptools::convolve( s , std::vector<double>() ).size() );
}

TEST(Convolution,modes)
{
  std::vector<double> s( 20 , 1.0 );
  std::vector<double> k( 9 , 0 );
  k[3] = k[4] = k[5] = 1;

  std::vector<double> full = dsptools::convolve( s , k , dsptools::CONV_FULL );
  std::vector<double> same = dsptools::convolve( s , k , dsptools::CONV_SAME );
  std::vector<double> valid = dsptools::convolve( s , k , dsptools::CONV_VALID );

  EXPECT_EQ( 28u , full.size() );
  EXPECT_EQ( 20u , same.size() );
  EXPECT_EQ( 12u , valid.size() );
  
  EXPECT_EQ( 0 , dsptools::conv_lead( dsptools::CONV_FULL , 9 ) );
  EXPECT_EQ( 4 , dsptools::conv_lead( dsptools::CONV_SAME , 9 ) );
  EXPECT_EQ( 8 , dsptools::conv_lead( dsptools::CONV_VALID , 9 ) );

  // even kernel: left of the two centre taps
  EXPECT_EQ( 1 , dsptools::conv_lead( dsptools::CONV_SAME , 4 ) );
  std::vector<double> s3( 3 ) , k2( 2 , 1.0 );
  s3[0] = 1; s3[1] = 2; s3[2] = 3;
  std::vector<double> same2 = dsptools::convolve( s3 , k2 , dsptools::CONV_SAME );
  ASSERT_EQ( 3u , same2.size() );
  EXPECT_DOUBLE_EQ( 1.0 , same2[0] );
  EXPECT_DOUBLE_EQ( 3.0 , same2[1] );
  EXPECT_DOUBLE_EQ( 5.0 , same2[2] );

  for (int j=0; j<same.size(); j++)
    EXPECT_DOUBLE_EQ( full[j+4] , same[j] );
  for (int j=0; j<valid.size(); j++)
    EXPECT_DOUBLE_EQ( 3.0 , valid[j] ) << "complete overlap";

  EXPECT_THROW( dsptools::convolve( k , s , dsptools::CONV_SAME ) , std::runtime_error ) << "kernel longer than signal";
}

TEST(Convolution,modeLabels)
{
  dsptools::conv_mode_t m = dsptools::CONV_FULL;
  EXPECT_TRUE( dsptools::conv_mode( "Valid" , &m ) );
  EXPECT_EQ( dsptools::CONV_VALID , m );
  EXPECT_EQ( "valid" , dsptools::conv_label( m ) );
  EXPECT_FALSE( dsptools::conv_mode( "circular" , &m ) );
  EXPECT_EQ( dsptools::CONV_VALID , m ) << "unchanged on failure";
}
