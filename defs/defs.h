
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

#ifndef __PWRUSE_DEFS_H__
#define __PWRUSE_DEFS_H__

#include <map>
#include <set>
#include <string>
#include <stdint.h>
#include <vector>

struct param_t; 

struct globals
{
  
  static std::string version;
  static std::string date;

  // number of decimal places for seconds (e.g. event times)
  static int time_format_dp; 

  // output common stratifier labels
  static std::string event_strat;
  static std::string episode_strat;
  static std::string sample_strat;
  
  // function to bail to if needed
  static void (*bail_function) ( const std::string & msg );

  // no console output at all (-q)
  static bool silent;

  // library use: no banner, no log file
  static bool api_mode;
  
  // generic global parameters
  static param_t param;

  static bool bail_on_fail;
  
  // global functions: primary initiation of all globals
  void init_defs();
  
  // modes
  void api();

};


#endif
