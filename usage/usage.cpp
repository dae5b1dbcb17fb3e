
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
#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "db/db.h"

#include <limits>

extern logger_t logger;

extern writer_t writer;


usage_result_t usage::run( const power_series_t & series , usage_param_t par )
{

  //
  // all structural checks before the first stage
  //
  
  par.validate( series );

  usage_result_t res;

  res.n = series.size();
  res.fs = par.fs;
  res.trim = par.trim_count();
  res.step = par.step_size();
  res.offset = sample_offset( par.conv , par.kernel.size() );

  
  //
  // low-pass filter, trend, matched filter
  //

  res.filtered = lowpass( series.x , par );

  trend( res.filtered , par.th , &res.deriv , &res.cand );

  res.mf = matched_filter( res.cand , par.kernel , par.conv );

  std::vector<int> us = on_samples( res.mf , res.offset , res.n );

  res.bursts = bursts( us , res.filtered );

  
  //
  // on/off state
  //

  if ( par.transitions )
    {
      logger << "  " << res.bursts.size() << " burst(s), each taken as one start/stop pair\n";
      res.state = transitions( us );
    }
  else
    res.state = reconcile( &res.bursts , res.filtered , res.step , res.trim , par.nonzero_taps() );

  
  //
  // events
  //

  res.events = edges( res.state , res.trim );

  for (int e=0; e<res.events.size(); e++)
    {
      usage_event_t & ev = res.events[e];
      ev.sec = series.elapsed( ev.sp );
      ev.label = series.labels[ ev.sp ];
    }
  
  res.alternates = alternates( res.events );

  if ( ! res.alternates )
    {
      if ( par.strict )
	Helper::halt( "start/stop events do not alternate" );
      logger.warning( "start/stop events do not alternate" );
    }

  res.episodes = episodes( res.events );

  logger << "  detected " << res.events.size() << " event(s), " 
	 << res.episodes.size() << " episode(s)"
	 << " (events before sample " << res.trim << " not reported)\n";
  
  
  //
  // per-sample trace
  //

  const double nan = std::numeric_limits<double>::quiet_NaN();
  
  res.trace = Eigen::MatrixXd::Constant( res.n , TR_NCOL , nan );

  for (int i=0; i<res.n; i++)
    {
      res.trace(i,TR_RAW) = series.x[i];
      res.trace(i,TR_FILT) = res.filtered[i];
      if ( i > 0 )
	{
	  res.trace(i,TR_DERIV) = res.deriv[i-1];
	  res.trace(i,TR_CAND) = res.cand[i-1];
	}
      res.trace(i,TR_MF) = us[i];
      res.trace(i,TR_STATE) = res.state[i];
    }
  
  return res;
}


void usage::report( const usage_result_t & res , const power_series_t & series , const usage_param_t & par )
{

  //
  // baseline
  //

  writer.value( "N" , res.n );
  writer.value( "FS" , res.fs );
  writer.value( "ORDER" , par.order );
  writer.value( "CUTOFF" , par.cutoff );
  writer.value( "TH" , par.th );
  writer.value( "KERNEL_LEN" , (int)par.kernel.size() );
  writer.value( "CONV" , dsptools::conv_label( par.conv ) );
  writer.value( "TRIM" , res.trim );
  if ( par.transitions )
    writer.missing_value( "STEP" );
  else
    writer.value( "STEP" , res.step );
  writer.value( "N_BURSTS" , (int)res.bursts.size() );
  writer.value( "N_EVENTS" , (int)res.events.size() );
  writer.value( "N_EPISODES" , (int)res.episodes.size() );
  writer.value( "ALT" , res.alternates ? 1 : 0 );

  
  //
  // events
  //

  for (int e=0; e<res.events.size(); e++)
    {
      const usage_event_t & ev = res.events[e];
      writer.level( e + 1 , globals::event_strat );
      writer.value( "SP" , ev.sp );
      writer.value( "TIME" , ev.label );
      writer.value( "SEC" , ev.sec );
      writer.value( "TYPE" , ev.type() );
    }
  writer.unlevel( globals::event_strat );

  
  //
  // episodes
  //

  for (int e=0; e<res.episodes.size(); e++)
    {
      const usage_episode_t & ep = res.episodes[e];
      const usage_event_t & a = res.events[ ep.start ];
      writer.level( e + 1 , globals::episode_strat );
      writer.value( "START" , a.label );
      writer.value( "START_SP" , a.sp );
      if ( ep.stop != -1 )
	{
	  const usage_event_t & b = res.events[ ep.stop ];
	  writer.value( "STOP" , b.label );
	  writer.value( "STOP_SP" , b.sp );
	  writer.value( "DUR" , b.sec - a.sec );
	}
      else
	{
	  writer.missing_value( "STOP" );
	  writer.missing_value( "STOP_SP" );
	  writer.missing_value( "DUR" );
	}
    }
  writer.unlevel( globals::episode_strat );
  

  //
  // per-sample trace
  //

  if ( ! par.dump ) return;

  const char * labels[] = { "RAW" , "FILT" , "DERIV" , "CAND" , "MF" , "STATE" };
  
  for (int i=0; i<res.n; i++)
    {
      writer.level( i , globals::sample_strat );
      for (int c=0; c<TR_NCOL; c++)
	{
	  const double x = res.trace(i,c);
	  if ( ! Helper::realnum( x ) )
	    writer.missing_value( labels[c] );
	  else if ( c == TR_RAW || c == TR_FILT || c == TR_DERIV )
	    writer.value( labels[c] , x );
	  else
	    writer.value( labels[c] , (int)x );
	}
    }
  writer.unlevel( globals::sample_strat );
  
}


usage_result_t usage::detect( const power_series_t & series , const param_t & param )
{

  usage_param_t par( param );

  usage_result_t res = run( series , par );

  // report with the fs actually used
  par.fs = res.fs;

  report( res , series , par );

  return res;
}

