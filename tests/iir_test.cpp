
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

#include "dsp/iir.h"

#include <cmath>
#include <algorithm>
#include <stdexcept>

TEST(ButterworthLowPass,sections)
{
  iir_t odd;
  odd.init( 5 , 10 , 3 );
  EXPECT_EQ( 5 , odd.order() );
  ASSERT_EQ( 3u , odd.sections().size() ) << "two biquads plus one first-order section";
  EXPECT_DOUBLE_EQ( 0.0 , odd.sections()[2].b2 );
  EXPECT_DOUBLE_EQ( 0.0 , odd.sections()[2].a2 );

  iir_t even;
  even.init( 4 , 100 , 10 );
  EXPECT_EQ( 2u , even.sections().size() );
}

TEST(ButterworthLowPass,unityGainAtDC)
{
  const int orders[] = { 1 , 2 , 5 , 8 };
  for (int i=0; i<4; i++)
    {
      iir_t iir;
      iir.init( orders[i] , 10 , 3 );
      EXPECT_NEAR( 1.0 , iir.dc_gain() , 1e-12 ) << "order " << orders[i];
    }
}

TEST(ButterworthLowPass,constantSignal)
{
  iir_t iir;
  iir.init( 5 , 10 , 3 );

  std::vector<double> x( 200 , 5.0 );
  std::vector<double> y = iir.apply( x );
  ASSERT_EQ( x.size() , y.size() );

  // zero initial state: starts from 0, settles within the first samples
  EXPECT_LT( y[0] , 5.0 );
  for (int i=50; i<200; i++)
    EXPECT_NEAR( 5.0 , y[i] , 1e-5 ) << "sample " << i;

  // forward-backward: constant at both ends of the record
  std::vector<double> z = iir.apply( x , true );
  ASSERT_EQ( x.size() , z.size() );
  for (int i=0; i<200; i++)
    EXPECT_NEAR( 5.0 , z[i] , 1e-9 ) << "sample " << i;

  // shorter than the padding
  std::vector<double> z2 = iir.apply( std::vector<double>( 7 , 5.0 ) , true );
  ASSERT_EQ( 7u , z2.size() );
  for (int i=0; i<7; i++)
    EXPECT_NEAR( 5.0 , z2[i] , 1e-9 ) << "sample " << i;
}

TEST(ButterworthLowPass,zeroPhaseHoldsFinalLevel)
{
  iir_t iir;
  iir.init( 5 , 10 , 3 );
  EXPECT_EQ( 18 , iir.padding() );

  // on at 150, still on at the end of the record
  std::vector<double> x( 300 , 0.0 );
  for (int i=150; i<300; i++) x[i] = 100;

  std::vector<double> z = iir.apply( x , true );
  ASSERT_EQ( 300u , z.size() );
  for (int i=200; i<300; i++)
    EXPECT_NEAR( 100.0 , z[i] , 1e-4 ) << "sample " << i;
  for (int i=0; i<100; i++)
    EXPECT_NEAR( 0.0 , z[i] , 1e-4 ) << "sample " << i;
}

TEST(ButterworthLowPass,attenuatesHighFrequency)
{
  // 0.5 Hz passes, 4.5 Hz (near Nyquist) is removed
  const double fs = 10;
  std::vector<double> lo( 400 ) , hi( 400 );
  for (int i=0; i<400; i++)
    {
      lo[i] = sin( 2 * M_PI * 0.5 * i / fs );
      hi[i] = sin( 2 * M_PI * 4.5 * i / fs );
    }

  iir_t iir;
  iir.init( 5 , fs , 3 );
  std::vector<double> ylo = iir.apply( lo );
  std::vector<double> yhi = iir.apply( hi );

  double plo = 0 , phi = 0;
  for (int i=200; i<400; i++)
    {
      plo = std::max( plo , fabs( ylo[i] ) );
      phi = std::max( phi , fabs( yhi[i] ) );
    }
  EXPECT_GT( plo , 0.9 );
  EXPECT_LT( phi , 0.1 );
}

TEST(ButterworthLowPass,badDesign)
{
  iir_t iir;
  EXPECT_THROW( iir.apply( std::vector<double>( 10 , 1 ) ) , std::runtime_error ) << "not initialized";
  EXPECT_THROW( iir.init( 0 , 10 , 3 ) , std::runtime_error );
  EXPECT_THROW( iir.init( 5 , 10 , 5 ) , std::runtime_error ) << "cutoff at Nyquist";
  EXPECT_THROW( iir.init( 5 , 10 , 0 ) , std::runtime_error );
  EXPECT_THROW( iir.init( 5 , -1 , 3 ) , std::runtime_error );
}
