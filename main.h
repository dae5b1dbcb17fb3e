
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



#ifndef __PWRUSE_MAIN_H__
#define __PWRUSE_MAIN_H__

#include <string>

// command-line options other than the usage parameters
struct cmdline_t
{
  cmdline_t() : time_col( "timestamp" ) , power_col( "power" ) { } 
  std::string input;
  std::string id;
  std::string time_col;
  std::string power_col;
  std::string out_db;
  std::string log_file;
};

// misc helper: version string
std::string pwruse_version();

// misc helper: evaluate command-line options
cmdline_t parse_cmdline( int argc , char ** argv );

// misc helper: manage memory resource issues
void NoMem();

#endif
