
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


#include "main.h"
#include "pwruse.h"

#include <cstring>
#include <cstdlib>
#include <new>
#include <sqlite3.h>

int main(int argc , char ** argv )
{
   
  //
  // initiate global defintions
  //
  
  std::set_new_handler(NoMem);

  global.init_defs();


  //
  // display version info?
  //
  
  bool show_version = argc >= 2 
    && ( strcmp( argv[1] ,"-v" ) == 0
	 || strcmp( argv[1] ,"--version" ) == 0 );
  
  if ( show_version )  
    {
      global.api();
      std::cerr << pwruse_version() ;
      std::cerr << "Eigen library v"
		<< EIGEN_WORLD_VERSION << "."
		<< EIGEN_MAJOR_VERSION << "."
		<< EIGEN_MINOR_VERSION << "\n";
      std::cerr << "sqlite v"
		<< sqlite3_libversion() << "\n";
      std::exit(0);
    }
  
  
  //
  // primary usage
  //
  
  std::string usage_msg = pwruse_version() +
    "primary usage: pwruse file.csv [id=ID] [time=col] [power=col] [@param-file]\n"
    "                      [key=value ...] [-o out.db] [-q] [--log=file]\n";

  const std::string option_msg =
    "options:\n"
    "  fs=<hz>           sampling rate (default: estimated from time-points)\n"
    "  order=<n>         Butterworth order (5)\n"
    "  cutoff=<hz>       low-pass cutoff (3)\n"
    "  zero-phase        forward-backward filtering\n"
    "  th=<w>            derivative threshold per sample (1.5)\n"
    "  kernel=<x,y,...>  matched-filter kernel (0,0,0,1,1,1,0,0,0)\n"
    "  conv=<mode>       full, same or valid (same)\n"
    "  trim=<n>          ignore events before sample n (order + half-kernel + 1)\n"
    "  step=<w>          level change needed to switch state (th x majority of kernel taps)\n"
    "  transitions       report each transition burst as a start/stop pair\n"
    "  strict            non-alternating start/stop events are an error\n"
    "  dump              per-sample trace (SP strata)\n";

  
  //
  // degenerate command line?
  //
  
  if ( argc == 1 )  
    {      
      logger << usage_msg << "\n";
      logger.off();
      std::exit(1);
    }

  
  //
  // help mode
  //

  if ( argc >= 2 && ( strcmp( argv[1] , "-h" ) == 0 || strcmp( argv[1] , "--help" ) == 0 ) ) 
    {
      global.api();
      std::cerr << "\n" << usage_msg << "\n" << option_msg << "\n";
      std::exit(0);
    }


  //
  // parse command line
  //

  cmdline_t cmdline = parse_cmdline( argc , argv );

  if ( cmdline.log_file != "" )
    logger.write_log( cmdline.log_file );

  logger.banner( globals::version , globals::date );

  if ( globals::param.size() > 0 )
    logger << "  options:\n" << globals::param.dump( "    " ) << "\n";

  
  //
  // attach output
  //

  if ( cmdline.out_db != "" )
    {
      // -o always starts a new database
      Helper::deleteFile( cmdline.out_db );
      writer.attach( cmdline.out_db );
      logger << "  writing output to " << cmdline.out_db << "\n";
    }
  else
    writer.nodb();

  
  //
  // load trace
  //

  power_series_t series;

  series.load( cmdline.input , cmdline.time_col , cmdline.power_col );

  logger << "\n  processing: " << cmdline.id << " [ " << cmdline.input << " ]\n";


  //
  // detect usage episodes
  //

  writer.begin();
  
  writer.id( cmdline.id , cmdline.input );

  writer.cmd( "USAGE" , 1 , globals::param.dump( "" , " " ) );

  usage::detect( series , globals::param );

  writer.commit();

  writer.close();

  if ( logger.warnings() > 0 )
    logger << "  " << logger.warnings() << " warning(s)\n";
  
  std::exit(0);
  
}


//
// report pwruse version
//

std::string pwruse_version() 
{
  std::stringstream ss;
  ss << "pwruse version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "pwruse build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


//
// "handle" out-of-memory conditions
//

void NoMem()
{
  std::cerr << "*****************************************************\n"
	    << "* FATAL ERROR    Exhausted system memory            *\n"
	    << "*                                                   *\n"
	    << "* Forced exit now...                                *\n"
	    << "*****************************************************\n\n";
  std::exit(1);
}


cmdline_t parse_cmdline( int argc , char ** argv )
{

  cmdline_t cmdline;
  
  for (int i=1; i<argc; i++)
    {

      const std::string arg = argv[i];

      // -o : specify database for output
	  
      if ( Helper::iequals( arg , "-o" ) )
	{
	  // next arg will be DB
	  if ( i + 1 >= argc )
	    Helper::halt( "expecting database name after -o" );
	  cmdline.out_db = argv[ ++i ];
	  continue;
	}
      
      // -q : quiet

      if ( arg == "-q" )
	{
	  globals::silent = true;
	  continue;
	}

      // --log=file

      if ( arg.substr( 0 , 6 ) == "--log=" )
	{
	  cmdline.log_file = arg.substr( 6 );
	  if ( cmdline.log_file == "" )
	    Helper::halt( "expecting --log=file" );
	  continue;
	}

      if ( arg[0] == '-' )
	Helper::halt( "unrecognized option " + arg );
      
      // @param file
      
      if ( arg[0] == '@' )
	{
	  globals::param.read( arg.substr(1) );
	  continue;
	}
      
      // key=value, or the first free-standing token is the input, then any flags
      
      if ( arg.find( "=" ) != std::string::npos || cmdline.input != "" )
	globals::param.parse( arg );
      else
	cmdline.input = arg;
      
    }

  // special variables, from the command line or a parameter file
  cmdline.id = globals::param.take( "id" );
  cmdline.time_col = globals::param.take( "time" , cmdline.time_col );
  cmdline.power_col = globals::param.take( "power" , cmdline.power_col );

  if ( cmdline.input == "" )
    Helper::halt( "no input file specified" );

  // default ID: file name without folder or extension
  if ( cmdline.id == "" )
    {
      std::string f = cmdline.input;
      std::string::size_type p = f.find_last_of( "/\\" );
      if ( p != std::string::npos ) f = f.substr( p + 1 );
      p = f.find_last_of( "." );
      if ( p != std::string::npos && p > 0 ) f = f.substr( 0 , p );
      cmdline.id = f;
    }
  
  return cmdline;
}

