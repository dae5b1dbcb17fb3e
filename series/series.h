
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


#ifndef __PWRUSE_SERIES_H__
#define __PWRUSE_SERIES_H__

#include <string>
#include <vector>
#include <cstddef>

//
// a single timestamped power trace, as read from a delimited text file
//

struct power_series_t
{
  
  power_series_t() : delim( ',' ) , has_dates( false ) { } 

  // read a header + rows file; columns selected by name (case-insensitive)
  void load( const std::string & filename ,
	     const std::string & time_col = "timestamp" ,
	     const std::string & power_col = "power" );

  // direct construction (seconds, watts); labels are the seconds
  void set( const std::vector<double> & t , const std::vector<double> & p );

  // halts (invalid input) on an empty series, columns of unequal length
  // or non-increasing time-points
  void validate() const;
  
  int size() const { return x.size(); }

  // (N-1) / ( t_last - t_first ), optionally flagging uneven spacing
  double estimate_fs( bool * uniform = NULL ) const;

  // seconds elapsed since the first sample
  double elapsed( const int i ) const { return tp[i] - tp[0]; } 

  // guess delimiter from the header row: tab, then semicolon, else comma
  static char detect_delim( const std::string & line );

  // parse a single time-point: plain seconds, or [date ]hh:mm:ss
  static bool parse_timepoint( const std::string & s , double * secs , bool * clock , bool * dated );
  
  std::string filename;
  
  char delim;

  bool has_dates;
  
  // time-points (seconds)
  std::vector<double> tp;

  // power values
  std::vector<double> x;

  // time-points as given in the input
  std::vector<std::string> labels;

};

#endif
