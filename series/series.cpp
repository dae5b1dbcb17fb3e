
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


#include "series/series.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <fstream>
#include <cmath>

extern logger_t logger;


char power_series_t::detect_delim( const std::string & line )
{
  if ( line.find( '\t' ) != std::string::npos ) return '\t';
  if ( line.find( ';' ) != std::string::npos ) return ';';
  return ',';
}


bool power_series_t::parse_timepoint( const std::string & s , double * secs , bool * clock , bool * dated )
{
  
  const std::string s1 = Helper::unquote( Helper::lrtrim( s ) );

  if ( s1.size() == 0 ) return false;
  
  // plain seconds
  if ( Helper::str2dbl( s1 , secs ) )
    {
      *clock = *dated = false;
      return true;
    }

  // clock-time, with or without a leading date
  clocktime_t ct( s1 );
  if ( ! ct.valid ) return false;

  *clock = true;
  *dated = s1.find_first_of( " T" ) != std::string::npos;
  *secs = ct.seconds();
  return true;
}


void power_series_t::load( const std::string & f ,
			   const std::string & time_col ,
			   const std::string & power_col )
{

  filename = Helper::expand( f );

  if ( ! Helper::fileExists( filename ) )
    Helper::halt( "invalid input: could not open " + filename );

  tp.clear();
  x.clear();
  labels.clear();
  
  std::ifstream IN1( filename.c_str() , std::ios::in );

  //
  // header
  //
  
  std::string line;

  bool first = true;
  
  while ( Helper::safe_getline( IN1 , line ) )
    {
      // UTF-8 byte order mark
      if ( first && line.compare( 0 , 3 , "\xEF\xBB\xBF" ) == 0 )
	line = line.substr( 3 );
      first = false;
      
      if ( IN1.eof() && line == "" ) break;
      if ( Helper::lrtrim( line ) != "" ) break;
    }

  if ( Helper::lrtrim( line ) == "" )
    Helper::halt( "invalid input: no header row in " + filename );
  
  delim = detect_delim( line );

  std::vector<std::string> hdr = Helper::quoted_parse( line , delim , '"' , '\'' , true );

  int tcol = -1 , pcol = -1;
  for (int j=0; j<hdr.size(); j++)
    {
      const std::string h = Helper::unquote( Helper::lrtrim( hdr[j] ) );
      if ( tcol == -1 && Helper::iequals( h , time_col ) ) tcol = j;
      if ( pcol == -1 && Helper::iequals( h , power_col ) ) pcol = j;
    }

  if ( tcol == -1 ) Helper::halt( "invalid input: no time column '" + time_col + "' in " + filename );
  if ( pcol == -1 ) Helper::halt( "invalid input: no power column '" + power_col + "' in " + filename );

  const int ncols = hdr.size();
  
  //
  // rows
  //

  int row = 1;
  first = true;
  bool clock_mode = false;
  double day_offset = 0;
  
  while ( Helper::safe_getline( IN1 , line ) )
    {
      ++row;

      if ( IN1.eof() && line == "" ) break;
      if ( Helper::lrtrim( line ) == "" ) continue;
      
      std::vector<std::string> tok = Helper::quoted_parse( line , delim , '"' , '\'' , true );
      
      if ( tok.size() != ncols )
	Helper::halt( "invalid input: expecting " + Helper::int2str( ncols ) 
		      + " fields but found " + Helper::int2str( (int)tok.size() ) 
		      + " on line " + Helper::int2str( row ) );
      
      double t = 0;
      bool clock = false , dated = false;
      if ( ! parse_timepoint( tok[ tcol ] , &t , &clock , &dated ) )
	Helper::halt( "invalid input: bad time-point '" + tok[ tcol ] + "' on line " + Helper::int2str( row ) );

      if ( first )
	{
	  clock_mode = clock;
	  has_dates = dated;
	  first = false;
	}
      else if ( clock != clock_mode || dated != has_dates )
	Helper::halt( "invalid input: mixed time-point formats on line " + Helper::int2str( row ) );

      // clock-times without dates: step over midnight
      if ( clock_mode && ! has_dates && tp.size() > 0 )
	{
	  if ( t + day_offset < tp.back() - 12 * 3600.0 )
	    day_offset += 24 * 3600.0;
	  t += day_offset;
	}

      double p = 0;
      const std::string ps = Helper::unquote( Helper::lrtrim( tok[ pcol ] ) );
      if ( ! Helper::str2dbl( ps , &p ) || ! Helper::realnum( p ) )
	Helper::halt( "invalid input: bad power value '" + tok[ pcol ] + "' on line " + Helper::int2str( row ) );

      tp.push_back( t );
      x.push_back( p );
      labels.push_back( Helper::unquote( Helper::lrtrim( tok[ tcol ] ) ) );
    }

  IN1.close();
  
  validate();

  logger << "  read " << x.size() << " samples from " << filename << "\n";
  
}


void power_series_t::set( const std::vector<double> & t , const std::vector<double> & p )
{
  if ( t.size() != p.size() )
    Helper::halt( "invalid input: time-points and power values differ in length" );

  tp = t;
  x = p;
  labels.resize( t.size() );
  for (int i=0; i<t.size(); i++)
    labels[i] = Helper::dbl2str( t[i] );
  has_dates = false;
  
  validate();
}


void power_series_t::validate() const
{
  if ( x.size() == 0 )
    Helper::halt( "invalid input: empty power series" );

  if ( tp.size() != x.size() || labels.size() != x.size() )
    Helper::halt( "invalid input: " + Helper::int2str( (int)x.size() ) + " power values but "
		  + Helper::int2str( (int)tp.size() ) + " time-points and "
		  + Helper::int2str( (int)labels.size() ) + " labels" );
  
  for (int i=1; i<tp.size(); i++)
    if ( tp[i] <= tp[i-1] )
      Helper::halt( "invalid input: time-points not strictly increasing at sample "
		    + Helper::int2str( i ) + " (" + labels[i] + ")" );
}


double power_series_t::estimate_fs( bool * uniform ) const
{
  const int n = tp.size();

  if ( n < 2 )
    Helper::halt( "invalid input: need at least two samples to estimate the sampling rate" );

  const double span = tp[n-1] - tp[0];
  const double fs = ( n - 1 ) / span;

  // flag spacing more than 10% off the mean interval
  const double mean_dt = span / (double)( n - 1 );
  bool even = true;
  for (int i=1; i<n; i++)
    if ( fabs( ( tp[i] - tp[i-1] ) - mean_dt ) > 0.1 * mean_dt )
      {
	even = false;
	break;
      }
  
  if ( uniform != NULL ) *uniform = even;
  
  return fs;
}

