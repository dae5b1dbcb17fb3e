
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


#ifndef __PWRUSE_TESTS_FIXTURES_H__
#define __PWRUSE_TESTS_FIXTURES_H__

#include <vector>
#include <string>
#include <fstream>

#include "series/series.h"

namespace fixtures {

  // 0 W, ramp to 100 W over five samples at 500, back down at 800
  inline std::vector<double> appliance_cycle( const int n = 1000 , const double base = 0 )
  {
    std::vector<double> x( n , 0 );
    for (int i=500; i<505; i++) x[i] = ( i - 499 ) * 20;
    for (int i=505; i<800; i++) x[i] = 100;
    for (int i=800; i<805; i++) x[i] = 100 - ( i - 799 ) * 20;
    for (int i=0; i<n; i++) x[i] += base;
    return x;
  }

  // evenly spaced time-points (seconds)
  inline power_series_t series( const std::vector<double> & x , const double dt = 0.1 )
  {
    std::vector<double> t( x.size() );
    for (int i=0; i<x.size(); i++) t[i] = i * dt;
    power_series_t s;
    s.set( t , x );
    return s;
  }

  inline void write_file( const std::string & filename , const std::string & text )
  {
    std::ofstream O1( filename.c_str() , std::ios::out );
    O1 << text;
    O1.close();
  }
  
}

#endif
