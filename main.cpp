
//    --------------------------------------------------------------------
//
//    This file is part of specsus.
//
//    specsus is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    specsus is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with specsus. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "specsus.h"
#include "main.h"

#include <cstring>
#include <fstream>
#include <stdexcept>

//
// global resources
//

extern globals global;

extern logger_t logger;


int main(int argc , char ** argv )
{

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
      std::cerr << specsus_version() ;
      std::exit( globals::retcode );
    }

  //
  // primary usage
  //
  
  std::string usage_msg = specsus_version() +
    "usage: specsus trace.txt fst=N [vehicle=M1|N1] [wheel=ID] [h25=N] [key=value ...] [@param-file]\n"
    "       specsus --sim [lag=deg] [fst=N] [noise=SD] [key=value ...]\n"
    "       specsus --axle left.txt right.txt fst_left=N fst_right=N [h25_left=N] [h25_right=N] [wheel_left=ID] [wheel_right=ID] [key=value ...]\n";

  if ( argc == 1 ) 
    {
      std::cerr << usage_msg << "\n";
      std::exit(1);
    }

  try 
    {
      
      const std::string mode = argv[1];

      const bool sim_mode = mode == "--sim";
      const bool axle_mode = mode == "--axle";

      if ( axle_mode && argc < 4 ) 
	Helper::halt( "--axle requires two trace files" );

      param_t param;
      build_param( &param , argc , argv , axle_mode ? 4 : 2 );

      if ( param.has( "log" ) ) 
	logger.write_log( param.value( "log" ) );

      logger.banner( globals::version , globals::date );
      
      // fails here on any bad setting
      egea_param_t egea_param( param );

      if ( egea_param.verbose ) 
	logger << egea_param.dump();

      
      //
      // Axle: two traces, evaluated in parallel
      //
      
      if ( axle_mode ) 
	{
	  wheel_input_t left, right;
	  
	  left.wheel_id = "left";
	  right.wheel_id = "right";
	  
	  read_trace( argv[2] , &left );
	  read_trace( argv[3] , &right );
	  
	  egea::set_wheel_options( param , "left" , &left );
	  egea::set_wheel_options( param , "right" , &right );

	  const std::string axle_id = param.has( "axle" ) ? param.value( "axle" ) : "axle";
	  
	  axle_result_t res = egea::evaluate_axle_async( axle_id , left , right , egea_param );
	  
	  report_axle( res );
	  
	  std::exit( globals::retcode );
	}
      
      
      //
      // Single wheel, from a file or simulated
      //
      
      wheel_input_t input;
      input.wheel_id = "wheel";

      if ( sim_mode ) 
	{
	  sweep_t sweep = dsptools::simulate_sweep( dsptools::sweep_param( param ) );
	  input.time = sweep.time;
	  input.position = sweep.position;
	  input.force = sweep.force;
	  input.platform_force = sweep.platform_force;
	  input.static_weight = sweep.static_weight;
	  input.wheel_id = "sim";
	  egea::set_wheel_options( param , "" , &input );
	}
      else
	{
	  read_trace( mode , &input );
	  egea::set_wheel_options( param , "" , &input );
	}

      egea_test_result_t res = egea::evaluate_wheel( input , egea_param );

      report_wheel( res );

    }
  catch ( const std::runtime_error & e ) 
    {
      std::cerr << "error : " << e.what() << "\n";
      std::exit(1);
    }
  
  std::exit( globals::retcode );
}


//
// build params from the command line
//

void build_param( param_t * param , int argc , char** argv , int start )
{
  for (int i=start; i<argc; i++)
    {
      std::string x = argv[i];
      if ( x == "" ) continue;

      // @param-file
      if ( x[0] == '@' ) 
	{
	  param->load( x.substr(1) );
	  continue;
	}

      // allow --key=value as well as key=value
      if ( x.size() > 2 && x.substr(0,2) == "--" ) x = x.substr(2);
      
      param->parse( x ); 
    }
}


//
// trace files: one row per sample, '#' starts a comment line
//

void read_trace( const std::string & filename , wheel_input_t * input )
{

  if ( ! Helper::fileExists( filename ) ) 
    Helper::halt( "could not open " + filename );
  
  std::ifstream IN1( filename.c_str() , std::ios::in );
  
  int ncols = 0;
  int line = 0;
  
  while ( ! IN1.eof() )
    {
      std::string s;
      Helper::safe_getline( IN1 , s );
      ++line;
      if ( IN1.eof() && s == "" ) break;

      s = Helper::lrtrim( s );
      if ( s == "" || s[0] == '#' ) continue;
      
      std::vector<std::string> tok = Helper::parse( s , " \t," );

      if ( ncols == 0 ) 
	{
	  ncols = tok.size();
	  if ( ncols != 3 && ncols != 4 ) 
	    Helper::halt( filename + " should have 3 or 4 columns (time position force [platform_force])" );
	}
      else if ( (int)tok.size() != ncols ) 
	Helper::halt( "bad number of columns in " + filename + ", line " + Helper::int2str( line ) );
      
      double t, p, f;
      if ( ! ( Helper::str2dbl( tok[0] , &t ) && Helper::str2dbl( tok[1] , &p ) && Helper::str2dbl( tok[2] , &f ) ) )
	Helper::halt( "bad numeric value in " + filename + ", line " + Helper::int2str( line ) );
      
      input->time.push_back( t );
      input->position.push_back( p );
      input->force.push_back( f );

      if ( ncols == 4 ) 
	{
	  double pf;
	  if ( ! Helper::str2dbl( tok[3] , &pf ) )
	    Helper::halt( "bad numeric value in " + filename + ", line " + Helper::int2str( line ) );
	  input->platform_force.push_back( pf );
	}
      
    }
  
  IN1.close();

  logger << "  read " << input->time.size() << " samples from " << filename << "\n";

}


//
// reports: ID / VAR / VALUE rows
//

static void row( const std::string & id , const std::string & var , const std::string & value )
{
  std::cout << id << "\t" << var << "\t" << value << "\n";
}

static std::string opt2str( const std::optional<double> & x , int dp = 2 )
{
  return x ? Helper::dbl2str( *x , dp ) : "NA";
}

void report_wheel( const egea_test_result_t & res )
{

  const std::string & id = res.wheel_id;

  row( id , "VEHICLE" , vehicle_type_str( res.vehicle_type ) );
  row( id , "FST" , Helper::dbl2str( res.phase.static_weight , 1 ) );
  row( id , "WEIGHT_OK" , res.weight_in_range ? "1" : "0" );

  row( id , "N_CYCLES" , Helper::int2str( res.phase.n_cycles ) );
  row( id , "N_PERIODS" , Helper::int2str( (int)res.phase.periods.size() ) );
  row( id , "PHI_MIN" , opt2str( res.phase.min_phase_shift ) );
  row( id , "I_PHI_MIN" , res.phase.integer_min_phase() ? Helper::int2str( *res.phase.integer_min_phase() ) : "NA" );
  row( id , "F_PHI_MIN" , opt2str( res.phase.min_phase_frequency ) );
  row( id , "PHI_18" , opt2str( res.phase.max_phase_shift ) );
  row( id , "RFA_PERIOD" , opt2str( res.phase.rfa_max_value ) );
  row( id , "F_RFA_PERIOD" , opt2str( res.phase.rfa_max_frequency ) );
  row( id , "F_UNDER" , res.phase.f_under_flag ? "1" : "0" );
  row( id , "F_OVER" , res.phase.f_over_flag ? "1" : "0" );

  row( id , "FMIN" , Helper::dbl2str( res.force.fmin , 2 ) );
  row( id , "FMAX" , Helper::dbl2str( res.force.fmax , 2 ) );
  row( id , "FA_MAX" , Helper::dbl2str( res.force.fa_max , 2 ) );
  row( id , "RFA_MAX" , Helper::dbl2str( res.force.rfa_max , 2 ) );
  row( id , "F_RES" , Helper::dbl2str( res.force.resonant_frequency , 2 ) );

  row( id , "H25" , Helper::dbl2str( res.rigidity.h25 , 2 ) );
  row( id , "H25_EST" , res.rigidity.h25_estimated ? "1" : "0" );
  row( id , "RIG" , Helper::dbl2str( res.rigidity.rigidity , 2 ) );
  row( id , "RIG_UNDER" , res.rigidity.warning_underinflation ? "1" : "0" );
  row( id , "RIG_OVER" , res.rigidity.warning_overinflation ? "1" : "0" );

  if ( res.dyncal ) 
    {
      row( id , "DYNCAL_N" , Helper::int2str( (int)res.dyncal->max_fp.size() ) );
      row( id , "DYNCAL" , res.dyncal->is_valid ? "1" : "0" );
    }
  
  row( id , "QI" , Helper::dbl2str( res.quality_index , 1 ) );
  row( id , "DAMPING" , Helper::dbl2str( res.damping_ratio , 3 ) );
  row( id , "QUALITY" , quality_str( res.quality ) );
  
  row( id , "ABS_PASS" , res.absolute_criterion_pass ? "1" : "0" );
  row( id , "PASS" , res.overall_pass ? "1" : "0" );

  for (size_t i=0; i<res.errors.size(); i++)
    row( id , "NOTE" , res.errors[i] );
  
}


void report_axle( const axle_result_t & res )
{

  report_wheel( res.left_wheel );
  report_wheel( res.right_wheel );

  const std::string & id = res.axle_id;
  
  row( id , "AXLE_WEIGHT" , Helper::dbl2str( res.axle_weight , 1 ) );
  row( id , "D_RFA_MAX" , opt2str( res.d_rfa_max ) );
  row( id , "D_PHI_MIN" , opt2str( res.d_phi_min ) );
  row( id , "D_I_PHI_MIN" , opt2str( res.d_i_phi_min ) );
  row( id , "D_RIG" , opt2str( res.d_rigidity ) );
  row( id , "REL_RFA_MAX_PASS" , res.relative_rfa_max_pass ? "1" : "0" );
  row( id , "REL_PHI_MIN_PASS" , res.relative_phi_min_pass ? "1" : "0" );
  row( id , "REL_RIG_PASS" , res.relative_rigidity_pass ? "1" : "0" );
  row( id , "PASS" , res.overall_pass ? "1" : "0" );

}


//
// report version
//

std::string specsus_version() 
{
  std::stringstream ss;
  ss << "specsus version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "specsus build date/time " << __DATE__ << " " << __TIME__ << "\n";
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
