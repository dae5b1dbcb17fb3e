
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


#include "usage/usage.h"

#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;


std::vector<int> usage::matched_filter( const std::vector<int> & cand ,
					const std::vector<double> & kernel ,
					dsptools::conv_mode_t mode )
{

  // 0/1 --> -1/+1
  std::vector<double> b( cand.size() );
  for (int i=0; i<cand.size(); i++)
    b[i] = cand[i] ? 1 : -1 ;

  std::vector<double> r = dsptools::convolve( b , kernel , mode );

  // sign decision (ties go to -1)
  std::vector<int> u( r.size() );
  int non = 0;
  for (int j=0; j<r.size(); j++)
    {
      u[j] = r[j] > 0 ? 1 : -1 ;
      if ( u[j] == 1 ) ++non;
    }

  logger << "  matched filter (" << dsptools::conv_label( mode ) << ", kernel " << Helper::stringize( kernel )
	 << "): " << non << " of " << u.size() << " points on\n";
  
  return u;
}


int usage::sample_offset( dsptools::conv_mode_t mode , int nkern )
{
  // conv lead, less kernel centre, plus the derivative shift
  return dsptools::conv_lead( mode , nkern ) - ( nkern - 1 ) / 2 + 1;
}


std::vector<int> usage::on_samples( const std::vector<int> & u , const int offset , const int n )
{

  std::vector<int> us( n , -1 );

  const int nu = u.size();
  if ( nu == 0 ) return us;
  
  for (int i=0; i<n; i++)
    {
      int j = i - offset;
      if ( j < 0 ) j = 0;
      else if ( j >= nu ) j = nu - 1;
      us[i] = u[j];
    }

  return us;
}


std::vector<usage_burst_t> usage::bursts( const std::vector<int> & us , const std::vector<double> & f )
{

  std::vector<usage_burst_t> b;
  
  const int n = us.size();

  int i = 0;
  while ( i < n )
    {
      if ( us[i] != 1 ) { ++i; continue; }
      const int a = i;
      while ( i < n && us[i] == 1 ) ++i;
      const int z = i - 1;

      const int lo = a > 0 ? a - 1 : 0 ;
      const int hi = z < f.size() ? z : (int)f.size() - 1 ;
      b.push_back( usage_burst_t( a , z , f[hi] - f[lo] ) );
    }
  
  return b;
}

