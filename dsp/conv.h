
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


#ifndef __PWRUSE_CONV_H__
#define __PWRUSE_CONV_H__

#include <vector>
#include <string>

namespace dsptools 
{ 

  enum conv_mode_t { CONV_FULL , CONV_SAME , CONV_VALID };
  
  // full discrete convolution, length nsig + nkern - 1
  std::vector<double> convolve( const std::vector<double> & signal , 
				const std::vector<double> & kernel ); 

  // full, or the central nsig (same) or nsig - nkern + 1 (valid) points
  std::vector<double> convolve( const std::vector<double> & signal , 
				const std::vector<double> & kernel ,
				conv_mode_t mode );

  // offset of the first returned point within the full convolution
  int conv_lead( conv_mode_t mode , int nkern );

  int conv_length( conv_mode_t mode , int nsig , int nkern );

  // full / same / valid (case-insensitive)
  bool conv_mode( const std::string & s , conv_mode_t * mode );

  std::string conv_label( conv_mode_t mode );
  
}

#endif
