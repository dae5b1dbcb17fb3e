
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

#ifndef __PWRUSE_PARAM_H__
#define __PWRUSE_PARAM_H__

#include <string>
#include <map>
#include <set>
#include <vector>
#include <sstream>

//
// key=value options for a run
//

struct param_t
{

 public:
  
  void add( const std::string & option , const std::string & value = "" ); 

  int size() const;
  
  void parse( const std::string & s );

  // read key=value pairs from a parameter file (% comments)
  void read( const std::string & filename );
  
  void clear();
  
  bool has(const std::string & s ) const;
  
  bool empty(const std::string & s ) const;
  
  bool yesno(const std::string & s ) const;

  std::string value( const std::string & s , const bool uppercase = false ) const;

  // value of s (or def if absent), removing s from the set
  std::string take( const std::string & s , const std::string & def = "" );
  
  // halt (invalid configuration) if absent or not a number
  int requires_int( const std::string & s ) const;
  
  double requires_dbl( const std::string & s ) const;

  std::string dump( const std::string & indent = "  ", const std::string & delim = "\n" ) const;
  
  std::vector<double> dblvector( const std::string & k , const std::string delim = "," ) const;

  std::set<std::string> keys() const;

private:

  std::map<std::string,std::string> opt;

};


#endif
