
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

#include <gtest/gtest.h>

#include <cmath>

#include "egea/dyncal.h"
#include "dsp/siggen.h"

TEST( DynCalTest , QuietPlatformIsValid )
{
  egea_param_t p;
  dynamic_calibrator_t cal( p );
  
  sweep_param_t sp;
  sweep_t s = dsptools::simulate_sweep( sp );
  
  dyncal_result_t res = cal.calibrate( s.platform_force , s.time , 12.5 );
  EXPECT_TRUE( res.is_valid );
  EXPECT_FALSE( res.error_message.has_value() );
  EXPECT_DOUBLE_EQ( res.platform_mass , 12.5 );

  ASSERT_GT( res.max_fp.size() , 0u );
  ASSERT_EQ( res.max_fp.size() , res.frequencies.size() );
  ASSERT_EQ( res.max_fp.size() , res.delta_period.size() );
  
  for (size_t i=0; i<res.max_fp.size(); i++)
    {
      EXPECT_GE( res.frequencies[i] , p.min_calc_freq );
      EXPECT_LE( res.frequencies[i] , p.max_calc_freq );
      EXPECT_NEAR( res.max_fp[i] , 2.0 , 0.01 );
      EXPECT_GE( res.delta_period[i] , 0 );
      EXPECT_LE( res.delta_period[i] , 180 );
    }
}

TEST( DynCalTest , NoisyPlatformIsInvalid )
{
  egea_param_t p;
  dynamic_calibrator_t cal( p );
  
  // 50 N exceeds 4 N/Hz below 12.5 Hz
  sweep_param_t sp;
  sp.platform_force_amplitude = 50;
  sweep_t s = dsptools::simulate_sweep( sp );
  
  dyncal_result_t res = cal.calibrate( s.platform_force , s.time );
  EXPECT_FALSE( res.is_valid );
  ASSERT_TRUE( res.error_message.has_value() );
  EXPECT_NE( res.error_message->find( "exceeds" ) , std::string::npos ) << *res.error_message;
}

TEST( DynCalTest , BudgetScalesWithFrequency )
{
  // 30 N passes with a 4 N/Hz budget only from 7.5 Hz up
  sweep_param_t sp;
  sp.platform_force_amplitude = 30;
  sweep_t s = dsptools::simulate_sweep( sp );

  egea_param_t p;
  EXPECT_FALSE( dynamic_calibrator_t( p ).calibrate( s.platform_force , s.time ).is_valid );

  p.min_calc_freq = 8;
  EXPECT_TRUE( dynamic_calibrator_t( p ).calibrate( s.platform_force , s.time ).is_valid );
}

TEST( DynCalTest , NoCyclesInWindow )
{
  egea_param_t p;
  dynamic_calibrator_t cal( p );
  
  std::vector<double> t( 3000 ) , f( 3000 );
  for (int i=0; i<3000; i++)
    {
      t[i] = i / 1000.0;
      f[i] = sin( 2 * M_PI * 3 * t[i] );
    }
  
  // no cycle breaks the budget
  dyncal_result_t res = cal.calibrate( f , t );
  EXPECT_TRUE( res.is_valid );
  EXPECT_EQ( res.max_fp.size() , 0u );
  EXPECT_FALSE( res.error_message.has_value() );
}

TEST( DynCalTest , BadInput )
{
  egea_param_t p;
  dynamic_calibrator_t cal( p );
  std::vector<double> t( 10 , 0.0 ) , f( 12 , 0.0 );
  dyncal_result_t res = cal.calibrate( f , t );
  EXPECT_FALSE( res.is_valid );
  ASSERT_TRUE( res.error_message.has_value() );
}
