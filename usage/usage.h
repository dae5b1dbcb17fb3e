
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


#ifndef __PWRUSE_USAGE_H__
#define __PWRUSE_USAGE_H__

#include <vector>
#include <string>
#include <set>

#include <Eigen/Dense>

#include "dsp/conv.h"

struct param_t;
struct power_series_t;


//
// run configuration
//

struct usage_param_t
{

  // defaults only
  usage_param_t();

  // defaults, overridden by any of: fs order cutoff zero-phase th kernel
  // conv trim step transitions strict dump
  usage_param_t( const param_t & param );
  
  // checks that need the series (fs/Nyquist, lengths); sets fs if estimated
  void validate( const power_series_t & series );
  
  // samples at the start of the record where events are not reported
  int trim_count() const;

  // minimum level change (W) across a burst to switch state
  double step_size() const;

  int nonzero_taps() const;
  
  static std::vector<double> default_kernel();

  static std::set<std::string> known_keys();

  // 0 : estimate from the time-points
  double fs;

  int order;

  double cutoff;

  bool zero_phase;

  double th;

  std::vector<double> kernel;

  dsptools::conv_mode_t conv;

  // -1 : derived default
  int trim;

  // < 0 : derived default
  double step;

  bool transitions;

  bool strict;

  bool dump;
  
 private:

  void check() const;

};


// a maximal run of matched-filter +1 samples 
struct usage_burst_t
{
  usage_burst_t( int a , int b , double delta ) 
  : start(a) , stop(b) , delta(delta) , accepted(false) , contained(false) { } 

  int start;
  int stop;

  // filtered level change, f[stop] - f[start-1]
  double delta;

  // did this burst switch the usage state?
  bool accepted;

  // a whole usage (on, then off) inside this one burst
  bool contained;
};


struct usage_event_t
{
  usage_event_t( int sp , bool start ) 
  : sp(sp) , start(start) , sec(0) { } 

  int sp;
  bool start;

  // seconds since the first sample
  double sec;

  // time-point as given in the input
  std::string label;

  std::string type() const { return start ? "START" : "STOP" ; } 
};


struct usage_episode_t
{
  // index into the event list; stop == -1 if still open at the end
  int start;
  int stop;
};


struct usage_result_t
{

  usage_result_t() : n(0) , fs(0) , trim(0) , step(0) , offset(0) , alternates(true) { } 
  
  int n;
  
  double fs;

  int trim;

  double step;

  // matched-filter output index j maps to sample j + offset
  int offset;
  
  // stage outputs, at their native lengths
  std::vector<double> filtered;   // N
  std::vector<double> deriv;      // N-1, D[i] belongs to sample i+1
  std::vector<int> cand;          // N-1, 0/1
  std::vector<int> mf;            // conv-mode length, -1/+1
  std::vector<int> state;         // N, 0/1
  
  std::vector<usage_burst_t> bursts;

  std::vector<usage_event_t> events;

  std::vector<usage_episode_t> episodes;

  bool alternates;

  // per-sample trace: RAW FILT DERIV CAND MF STATE (NaN where undefined)
  Eigen::MatrixXd trace;
  
};


namespace usage {

  enum trace_col_t { TR_RAW = 0 , TR_FILT , TR_DERIV , TR_CAND , TR_MF , TR_STATE , TR_NCOL };
  
  // low-pass filter
  std::vector<double> lowpass( const std::vector<double> & x , const usage_param_t & par );

  // first difference, right-aligned, and |D| > th candidate
  void trend( const std::vector<double> & f , const double th ,
	      std::vector<double> * d , std::vector<int> * cand );

  // sign of the candidate (as -1/+1) convolved with the kernel
  std::vector<int> matched_filter( const std::vector<int> & cand ,
				   const std::vector<double> & kernel ,
				   dsptools::conv_mode_t mode );

  // sample index of matched-filter output 0
  int sample_offset( dsptools::conv_mode_t mode , int nkern );

  // matched-filter output resampled onto the record (length n)
  std::vector<int> on_samples( const std::vector<int> & u , const int offset , const int n );

  // runs of +1, with filtered level change across each
  std::vector<usage_burst_t> bursts( const std::vector<int> & us , const std::vector<double> & f );

  // samples the filtered level stays above half height, for a burst that
  // rises and falls back by more than 'step'; otherwise 0
  int pulse_width( const usage_burst_t & burst , const std::vector<double> & f , const double step );
  
  // on/off state from burst polarity; marks accepted bursts
  std::vector<int> reconcile( std::vector<usage_burst_t> * b , const std::vector<double> & f ,
			      const double step , const int trim , const int min_width );

  // on/off state taken directly from the matched filter
  std::vector<int> transitions( const std::vector<int> & us );

  // start (0->1) and stop (1->0) events, none before sample 'trim'
  std::vector<usage_event_t> edges( const std::vector<int> & state , const int trim );

  // strictly start, stop, start, ... 
  bool alternates( const std::vector<usage_event_t> & events );

  // pair each start with the next stop
  std::vector<usage_episode_t> episodes( const std::vector<usage_event_t> & events );

  // all stages
  usage_result_t run( const power_series_t & series , usage_param_t par );

  // writer output: baseline, E, EP and (if dump) SP strata
  void report( const usage_result_t & res , const power_series_t & series , const usage_param_t & par );

  // configure, run and report
  usage_result_t detect( const power_series_t & series , const param_t & param );
  
}

#endif
