
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

#include "series/series.h"
#include "param.h"
#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;


std::vector<double> usage_param_t::default_kernel()
{
  // idealized transition: three samples of change, centred in nine
  std::vector<double> k( 9 , 0 );
  k[3] = k[4] = k[5] = 1;
  return k;
}


std::set<std::string> usage_param_t::known_keys()
{
  std::set<std::string> s;
  s.insert( "fs" );
  s.insert( "order" );
  s.insert( "cutoff" );
  s.insert( "zero-phase" );
  s.insert( "th" );
  s.insert( "kernel" );
  s.insert( "conv" );
  s.insert( "trim" );
  s.insert( "step" );
  s.insert( "transitions" );
  s.insert( "strict" );
  s.insert( "dump" );
  return s;
}


usage_param_t::usage_param_t()
{
  fs = 0;
  order = 5;
  cutoff = 3;
  zero_phase = false;
  th = 1.5;
  kernel = default_kernel();
  conv = dsptools::CONV_SAME;
  trim = -1;
  step = -1;
  transitions = false;
  strict = false;
  dump = false;
}


usage_param_t::usage_param_t( const param_t & param )
{

  *this = usage_param_t();
  
  if ( param.has( "fs" ) )
    {
      fs = param.requires_dbl( "fs" );
      if ( fs <= 0 ) Helper::halt( "invalid configuration: fs must be positive" );
    }

  if ( param.has( "order" ) ) order = param.requires_int( "order" );

  if ( param.has( "cutoff" ) ) cutoff = param.requires_dbl( "cutoff" );

  zero_phase = param.yesno( "zero-phase" );

  if ( param.has( "th" ) ) th = param.requires_dbl( "th" );

  if ( param.has( "kernel" ) )
    kernel = param.dblvector( "kernel" );
  
  if ( param.has( "conv" ) )
    {
      if ( ! dsptools::conv_mode( param.value( "conv" ) , &conv ) )
	Helper::halt( "invalid configuration: conv must be full, same or valid, not '" + param.value( "conv" ) + "'" );
    }

  if ( param.has( "trim" ) )
    {
      trim = param.requires_int( "trim" );
      if ( trim < 0 ) Helper::halt( "invalid configuration: trim cannot be negative" );
    }
  
  if ( param.has( "step" ) )
    {
      step = param.requires_dbl( "step" );
      if ( step < 0 ) Helper::halt( "invalid configuration: step cannot be negative" );
    }
  
  transitions = param.yesno( "transitions" );
  strict = param.yesno( "strict" );
  dump = param.yesno( "dump" );

  // likely typos
  const std::set<std::string> known = known_keys();
  const std::set<std::string> keys = param.keys();
  std::set<std::string>::const_iterator kk = keys.begin();
  while ( kk != keys.end() )
    {
      if ( known.find( *kk ) == known.end() )
	logger.warning( "ignoring unrecognized option " + *kk );
      ++kk;
    }
  
  check();
}


void usage_param_t::check() const
{
  if ( order < 1 )
    Helper::halt( "invalid configuration: order must be a positive integer" );

  if ( cutoff <= 0 )
    Helper::halt( "invalid configuration: cutoff must be positive" );
  
  if ( th <= 0 )
    Helper::halt( "invalid configuration: th must be positive" );

  if ( kernel.size() == 0 )
    Helper::halt( "invalid configuration: empty kernel" );

  if ( nonzero_taps() == 0 )
    Helper::halt( "invalid configuration: kernel has no non-zero values" );
}


void usage_param_t::validate( const power_series_t & series )
{

  check();

  series.validate();
  
  const int n = series.size();
  
  // candidate length (N-1) must cover the kernel 
  if ( n - 1 < (int)kernel.size() )
    Helper::halt( "invalid configuration: " + Helper::int2str( n ) + " samples is too short for a kernel of length "
		  + Helper::int2str( (int)kernel.size() ) + " (need at least " + Helper::int2str( (int)kernel.size() + 1 ) + ")" );

  if ( fs == 0 )
    {
      bool uniform = true;
      fs = series.estimate_fs( &uniform );
      logger << "  estimated sampling rate " << fs << " Hz from " << n << " time-points\n";
      if ( ! uniform )
	logger.warning( "time-points are not evenly spaced (more than 10% off the mean interval)" );
    }

  if ( fs <= 0 || ! Helper::realnum( fs ) )
    Helper::halt( "invalid configuration: fs must be positive" );
  
  if ( cutoff >= fs / 2.0 )
    Helper::halt( "invalid configuration: cutoff (" + Helper::dbl2str( cutoff ) 
		  + " Hz) must be below the Nyquist frequency (" + Helper::dbl2str( fs / 2.0 ) + " Hz)" );
  
}


int usage_param_t::nonzero_taps() const
{
  int s = 0;
  for (int i=0; i<kernel.size(); i++)
    if ( kernel[i] != 0 ) ++s;
  return s;
}


int usage_param_t::trim_count() const
{
  if ( trim >= 0 ) return trim;
  // filter start-up, kernel half-width, derivative shift
  return order + ( (int)kernel.size() - 1 ) / 2 + 1;
}


double usage_param_t::step_size() const
{
  if ( step >= 0 ) return step;
  // ceil( ( s + 1 ) / 2 ) samples, each moving more than th
  return th * ( ( nonzero_taps() + 2 ) / 2 );
}

