
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

#include "defs/defs.h"
#include "param.h"
#include "db/db.h"
#include "helper/helper.h"

extern writer_t writer;

std::string globals::version;
std::string globals::date;

int globals::time_format_dp;

std::string globals::event_strat;
std::string globals::episode_strat;
std::string globals::sample_strat;

void (*globals::bail_function) ( const std::string & );

bool globals::silent;
bool globals::api_mode;

param_t globals::param;

bool globals::bail_on_fail;


void globals::api()
{
  api_mode = true;
  silent = true;
  writer.nodb();
}

void globals::init_defs()
{

  
  //
  // Version
  //
  
  version = "v0.3.1";
  
  date    = "17-Oct-2026";

  //
  // Output/logging behaviour
  //

  bail_function = NULL;

  bail_on_fail = true;

  silent = false;

  api_mode = false;

  // event times printed to the millisecond
  time_format_dp = 3;
  
  //
  // Common stratifiers
  //

  event_strat   = "E";

  episode_strat = "EP";

  sample_strat  = "SP";
  
}

