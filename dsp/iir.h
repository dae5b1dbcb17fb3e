
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


#ifndef __PWRUSE_DSP_IIR_H__
#define __PWRUSE_DSP_IIR_H__

#include <vector>
#include <cmath>

// one biquad, a0 normalized to 1
struct sos_t {

  sos_t( double b0 = 1 , double b1 = 0 , double b2 = 0 , double a1 = 0 , double a2 = 0 )
    : b0(b0), b1(b1), b2(b2), a1(a1), a2(a2) { } 
  
  double b0, b1, b2;
  double a1, a2;
};


//
// Butterworth low-pass, bilinear transform with pre-warping, realized as
// a cascade of second-order sections (plus one first-order section for
// odd orders)
//

struct iir_t {

  iir_t();

  // order, sampling rate (Hz), cutoff (Hz)
  void init( int order , double fs , double cutoff );

  // causal pass, zero initial conditions; or, if zero_phase, forward-backward
  // over an odd extension of the record, each pass started in steady state
  std::vector<double> apply( const std::vector<double> & x , const bool zero_phase = false ) const;

  // samples added at each end for a forward-backward pass
  int padding() const { return 3 * ( n + 1 ); }

  // gain at 0 Hz (unity for a correctly designed low-pass)
  double dc_gain() const;
  
  int order() const { return n; } 

  const std::vector<sos_t> & sections() const { return sos; }
  
private:

  // steady : each section starts in the steady state for its first input
  std::vector<double> forward( const std::vector<double> & x , const bool steady = false ) const;
  
  int n;

  std::vector<sos_t> sos;
  
};


#endif
