
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

#include "dsp/iir.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;


std::vector<double> usage::lowpass( const std::vector<double> & x , const usage_param_t & par )
{

  iir_t iir;
  
  iir.init( par.order , par.fs , par.cutoff );
  
  logger << "  low-pass filtering " << x.size() << " samples with "
	 << par.order << "-order Butterworth IIR, cutoff " << par.cutoff << " Hz"
	 << " (fs = " << par.fs << " Hz, " << ( par.zero_phase ? "zero-phase" : "causal" ) << ")\n";

  return iir.apply( x , par.zero_phase );
  
}


void usage::trend( const std::vector<double> & f , const double th ,
		   std::vector<double> * d , std::vector<int> * cand )
{

  const int n = f.size();

  d->clear();
  cand->clear();
  
  if ( n < 2 ) return;
  
  d->resize( n - 1 );
  cand->resize( n - 1 );

  int non = 0;
  
  for (int i=0; i<n-1; i++)
    {
      (*d)[i] = f[i+1] - f[i];
      (*cand)[i] = fabs( (*d)[i] ) > th ;
      if ( (*cand)[i] ) ++non;
    }

  logger << "  " << non << " of " << n - 1 << " derivative samples exceed th = " << th << "\n";
  
}

