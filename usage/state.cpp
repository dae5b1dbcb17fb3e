
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

#include <algorithm>
#include <cmath>

extern logger_t logger;


int usage::pulse_width( const usage_burst_t & burst , const std::vector<double> & f , const double step )
{

  const int n = f.size();
  if ( n == 0 ) return 0;
  
  const int lo = burst.start > 0 ? burst.start - 1 : 0 ;
  const int hi = burst.stop < n ? burst.stop : n - 1 ;
  if ( burst.start > hi ) return 0;
  
  int p = burst.start;
  for (int i=burst.start; i<=hi; i++)
    if ( f[i] > f[p] ) p = i;
  
  // must rise and fall back by more than the step
  if ( f[p] - f[lo] <= step || f[p] - f[hi] <= step ) return 0;
  
  const double half = f[lo] + ( f[p] - f[lo] ) / 2.0;

  int up = burst.start;
  while ( f[up] < half ) ++up;

  int down = p + 1;
  while ( down <= hi && f[down] >= half ) ++down;
  if ( down > hi ) return 0;

  return down - up;
}


std::vector<int> usage::reconcile( std::vector<usage_burst_t> * b , const std::vector<double> & f ,
				   const double step , const int trim , const int min_width )
{

  const int n = f.size();
  
  std::vector<int> z( n , 0 );

  bool on = false;

  // sample where the current state began
  int from = 0;

  int nacc = 0 , nskip = 0 , npulse = 0;
  
  for (int k=0; k<b->size(); k++)
    {
      usage_burst_t & burst = (*b)[k];

      // filter start-up
      if ( burst.start < trim ) { ++nskip; continue; }

      if ( ! on && burst.delta > step )
	{
	  on = true;
	  from = burst.start;
	  burst.accepted = true;
	  ++nacc;
	}
      else if ( on && burst.delta < -step )
	{
	  for (int i=from; i<burst.start; i++) z[i] = 1;
	  on = false;
	  burst.accepted = true;
	  ++nacc;
	}
      else if ( ! on && fabs( burst.delta ) <= step )
	{
	  // on and back off within one burst: kept if the level stays
	  // above half height for longer than min_width samples
	  const int w = pulse_width( burst , f , step );
	  if ( w > min_width )
	    {
	      const int stop = std::min( burst.start + w , n );
	      for (int i=burst.start; i<stop; i++) z[i] = 1;
	      burst.accepted = burst.contained = true;
	      ++npulse;
	    }
	}
    }

  // still on at the end of the record
  if ( on )
    for (int i=from; i<n; i++) z[i] = 1;
  
  logger << "  " << b->size() << " burst(s): " << nacc << " switched state (step = " << step << " W)";
  if ( npulse ) logger << ", " << npulse << " short usage(s) within a single burst";
  if ( nskip ) logger << ", " << nskip << " inside the first " << trim << " samples";
  logger << "\n";
  
  return z;
}


std::vector<int> usage::transitions( const std::vector<int> & us )
{
  std::vector<int> z( us.size() );
  for (int i=0; i<us.size(); i++)
    z[i] = us[i] == 1;
  return z;
}

