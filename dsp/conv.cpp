
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


#include "dsp/conv.h"

#include "helper/helper.h"

#include <cstddef>
#include <cstdio>


std::vector<double> dsptools::convolve( const std::vector<double> & signal , 
					const std::vector<double> & kernel )
{

  const int nsig = signal.size();
  const int nkern = kernel.size();

  if ( nsig == 0 || nkern == 0 ) return std::vector<double>();
  
  const int nconv = nsig + nkern - 1 ; 

  std::vector<double> result( nconv , 0 );

  for (int n=0; n < nconv; n++ )
    {
      
      size_t kmin, kmax;

      kmin = (n >= nkern - 1) ? n - (nkern - 1) :  0;
      kmax = (n < nsig - 1)   ? n               :  nsig - 1;

      for (size_t k = kmin; k <= kmax; k++)
	result[n] += signal[k] * kernel[n - k];       
    }
  
  return result;

}


int dsptools::conv_lead( conv_mode_t mode , int nkern )
{
  if ( mode == CONV_SAME ) return ( nkern - 1 ) / 2;
  if ( mode == CONV_VALID ) return nkern - 1;
  return 0;
}


int dsptools::conv_length( conv_mode_t mode , int nsig , int nkern )
{
  if ( mode == CONV_SAME ) return nsig;
  if ( mode == CONV_VALID ) return nsig >= nkern ? nsig - nkern + 1 : 0 ;
  return nsig + nkern - 1;
}


std::vector<double> dsptools::convolve( const std::vector<double> & signal , 
					const std::vector<double> & kernel ,
					conv_mode_t mode )
{
  
  if ( kernel.size() > signal.size() )
    Helper::halt( "invalid configuration: kernel (" + Helper::int2str( (int)kernel.size() ) 
		  + ") longer than signal (" + Helper::int2str( (int)signal.size() ) + ")" );
  
  std::vector<double> full = convolve( signal , kernel );

  if ( mode == CONV_FULL ) return full;
  
  const int lead = conv_lead( mode , kernel.size() );
  const int len = conv_length( mode , signal.size() , kernel.size() );

  return std::vector<double>( full.begin() + lead , full.begin() + lead + len );
}


bool dsptools::conv_mode( const std::string & s , conv_mode_t * mode )
{
  if ( Helper::iequals( s , "full" ) ) *mode = CONV_FULL;
  else if ( Helper::iequals( s , "same" ) ) *mode = CONV_SAME;
  else if ( Helper::iequals( s , "valid" ) ) *mode = CONV_VALID;
  else return false;
  return true;
}


std::string dsptools::conv_label( conv_mode_t mode )
{
  if ( mode == CONV_SAME ) return "same";
  if ( mode == CONV_VALID ) return "valid";
  return "full";
}

