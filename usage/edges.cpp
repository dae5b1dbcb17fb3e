
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


std::vector<usage_event_t> usage::edges( const std::vector<int> & state , const int trim )
{

  std::vector<usage_event_t> ev;

  // E[i] = Z[i] - Z[i-1], belongs to sample i
  for (int i=1; i<state.size(); i++)
    {
      const int e = state[i] - state[i-1];
      if ( e == 0 ) continue;
      if ( i < trim ) continue;
      ev.push_back( usage_event_t( i , e > 0 ) );
    }

  return ev;
}


bool usage::alternates( const std::vector<usage_event_t> & events )
{
  for (int e=0; e<events.size(); e++)
    {
      // even positions are starts
      const bool expect_start = e % 2 == 0;
      if ( events[e].start != expect_start ) return false;
    }
  return true;
}


std::vector<usage_episode_t> usage::episodes( const std::vector<usage_event_t> & events )
{

  std::vector<usage_episode_t> ep;

  int open = -1;
  
  for (int e=0; e<events.size(); e++)
    {
      if ( events[e].start )
	{
	  // a repeated start closes nothing: keep the first
	  if ( open == -1 ) open = e;
	}
      else if ( open != -1 )
	{
	  usage_episode_t x;
	  x.start = open;
	  x.stop = e;
	  ep.push_back( x );
	  open = -1;
	}
    }

  if ( open != -1 )
    {
      usage_episode_t x;
      x.start = open;
      x.stop = -1;
      ep.push_back( x );
    }
  
  return ep;
}

