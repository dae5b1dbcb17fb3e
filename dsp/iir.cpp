
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


#include "dsp/iir.h"

#include "helper/helper.h"

#include <algorithm>


iir_t::iir_t()
{
  n = 0;
}


void iir_t::init( int order , double fs , double cutoff )
{

  if ( order < 1 )
    Helper::halt( "invalid configuration: filter order must be a positive integer" );
  
  if ( fs <= 0 )
    Helper::halt( "invalid configuration: sampling rate must be positive" );
  
  if ( cutoff <= 0 || cutoff >= fs / 2.0 )
    Helper::halt( "invalid configuration: cutoff must be above 0 and below the Nyquist frequency ("
		  + Helper::dbl2str( fs / 2.0 ) + " Hz)" );
  
  n = order;
  sos.clear();
  
  // pre-warped analog frequency
  const double K = tan( M_PI * cutoff / fs );
  const double K2 = K * K;
  
  // conjugate pole pairs
  for (int k = 0 ; k < n / 2 ; k++)
    {
      const double theta = M_PI * ( 2 * k + 1 ) / ( 2.0 * n );
      const double a = 2.0 * sin( theta );
      const double norm = 1.0 / ( 1.0 + a * K + K2 );
      
      const double b0 = K2 * norm;
      sos.push_back( sos_t( b0 , 2.0 * b0 , b0 ,
			    2.0 * ( K2 - 1.0 ) * norm ,
			    ( 1.0 - a * K + K2 ) * norm ) );
    }

  // real pole
  if ( n % 2 == 1 )
    {
      const double b0 = K / ( 1.0 + K );
      sos.push_back( sos_t( b0 , b0 , 0 , ( K - 1.0 ) / ( K + 1.0 ) , 0 ) );
    }
  
}


std::vector<double> iir_t::forward( const std::vector<double> & x , const bool steady ) const
{

  std::vector<double> y = x;
  
  const int np = y.size();

  if ( np == 0 ) return y;
  
  // direct form II transposed, section by section
  for (int s = 0 ; s < sos.size() ; s++)
    {
      const sos_t & f = sos[s];

      double z1 = 0 , z2 = 0;

      if ( steady )
	{
	  // state that a constant input y[0] would have left behind
	  const double g = ( f.b0 + f.b1 + f.b2 ) / ( 1.0 + f.a1 + f.a2 );
	  z2 = ( f.b2 - f.a2 * g ) * y[0];
	  z1 = ( f.b1 - f.a1 * g ) * y[0] + z2;
	}
      
      for (int i = 0 ; i < np ; i++)
	{
	  const double in = y[i];
	  const double out = f.b0 * in + z1;
	  z1 = f.b1 * in - f.a1 * out + z2;
	  z2 = f.b2 * in - f.a2 * out;
	  y[i] = out;
	}
    }
  
  return y;
}


std::vector<double> iir_t::apply( const std::vector<double> & x , const bool zero_phase ) const
{

  if ( sos.size() == 0 )
    Helper::halt( "internal error: iir_t::apply() called before init()" );
  
  if ( ! zero_phase ) return forward( x );

  const int np = x.size();

  if ( np == 0 ) return x;
  
  const int pad = std::min( padding() , np - 1 );

  // odd extension about the first and last samples
  std::vector<double> ext;
  ext.reserve( np + 2 * pad );
  for (int i = pad ; i > 0 ; i--)
    ext.push_back( 2 * x[0] - x[i] );
  ext.insert( ext.end() , x.begin() , x.end() );
  for (int i = 1 ; i <= pad ; i++)
    ext.push_back( 2 * x[np-1] - x[np-1-i] );
  
  std::vector<double> y = forward( ext , true );
  std::reverse( y.begin() , y.end() );
  y = forward( y , true );
  std::reverse( y.begin() , y.end() );

  return std::vector<double>( y.begin() + pad , y.begin() + pad + np );
}


double iir_t::dc_gain() const
{
  double g = 1.0;
  for (int s = 0 ; s < sos.size() ; s++)
    g *= ( sos[s].b0 + sos[s].b1 + sos[s].b2 ) / ( 1.0 + sos[s].a1 + sos[s].a2 );
  return g;
}

