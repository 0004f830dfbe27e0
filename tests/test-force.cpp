
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

#include "egea/force.h"
#include "test-util.h"

static void force_trace( double fst , double b , std::vector<double> * force , std::vector<double> * time )
{
  force->clear();
  time->clear();
  for (int i=0; i<2000; i++)
    {
      const double t = i / 1000.0;
      time->push_back( t );
      force->push_back( fst + b * sin( 2 * M_PI * 5 * t ) );
    }
}

TEST( ForceTest , NoFlagsUsesTroughDepth )
{
  egea_param_t p;
  force_analyzer_t analyzer( p );
  std::vector<double> f, t;
  force_trace( 500 , 100 , &f , &t );

  force_result_t res = analyzer.analyze( f , t , 500 );
  ASSERT_TRUE( res.is_valid() );
  EXPECT_FALSE( res.f_under_flag );
  EXPECT_FALSE( res.f_over_flag );
  EXPECT_NEAR( res.fmin , 400 , 1.0 );
  EXPECT_NEAR( res.fmax , 600 , 1.0 );
  EXPECT_DOUBLE_EQ( res.fa_max , 500 - res.fmin );
  EXPECT_NEAR( res.rfa_max , 20.0 , 0.2 );
  EXPECT_DOUBLE_EQ( res.rfa_max , res.fa_max / 500 * 100 );
  EXPECT_DOUBLE_EQ( res.static_weight , 500 );

  // resonance from the time of the minimum
  ASSERT_GT( res.t_fmin , 0 );
  EXPECT_DOUBLE_EQ( res.resonant_frequency , 1.0 / ( 2.0 * res.t_fmin ) );
}

TEST( ForceTest , UnderflowUsesPeakHeight )
{
  egea_param_t p;
  force_analyzer_t analyzer( p );
  std::vector<double> f, t;
  force_trace( 500 , 600 , &f , &t );

  force_result_t res = analyzer.analyze( f , t , 500 );
  EXPECT_TRUE( res.f_under_flag );
  EXPECT_FALSE( res.f_over_flag );
  EXPECT_DOUBLE_EQ( res.fa_max , res.fmax - 500 );
  EXPECT_NEAR( res.fa_max , 600 , 2.0 );
  ASSERT_GT( res.t_fmax , 0 );
  EXPECT_DOUBLE_EQ( res.resonant_frequency , 1.0 / ( 2.0 * res.t_fmax ) );
}

TEST( ForceTest , BothFlagsUseLimits )
{
  egea_param_t p;
  p.f_over_lim = 1000;
  force_analyzer_t analyzer( p );
  std::vector<double> f, t;
  force_trace( 500 , 600 , &f , &t );

  force_result_t res = analyzer.analyze( f , t , 500 );
  EXPECT_TRUE( res.f_under_flag );
  EXPECT_TRUE( res.f_over_flag );
  // max( 1000 - 500 , 500 - 5 )
  EXPECT_DOUBLE_EQ( res.fa_max , 500 );
  EXPECT_DOUBLE_EQ( res.rfa_max , 100 );
  EXPECT_DOUBLE_EQ( res.resonant_frequency , 0 );
}

TEST( ForceTest , OverflowAloneUsesLimits )
{
  egea_param_t p;
  p.f_over_lim = 650;
  force_analyzer_t analyzer( p );
  std::vector<double> f, t;
  force_trace( 500 , 200 , &f , &t );

  force_result_t res = analyzer.analyze( f , t , 500 );
  EXPECT_FALSE( res.f_under_flag );
  EXPECT_TRUE( res.f_over_flag );
  EXPECT_DOUBLE_EQ( res.fa_max , 495 );
  EXPECT_DOUBLE_EQ( res.resonant_frequency , 0 );
}

TEST( ForceTest , RejectsBadInput )
{
  egea_param_t p;
  force_analyzer_t analyzer( p );
  std::vector<double> f, t;
  force_trace( 500 , 100 , &f , &t );

  force_result_t r1 = analyzer.analyze( f , t , 0 );
  EXPECT_FALSE( r1.is_valid() );
  EXPECT_NE( r1.error.find( "static weight" ) , std::string::npos );

  f.resize( 100 );
  force_result_t r2 = analyzer.analyze( f , t , 500 );
  EXPECT_FALSE( r2.is_valid() );
  EXPECT_NE( r2.error.find( "length" ) , std::string::npos );
}

TEST( ForceTest , HighFrequencyNoiseDoesNotInflateExtremes )
{
  egea_param_t p;
  force_analyzer_t analyzer( p );
  std::vector<double> f, t;
  force_trace( 500 , 100 , &f , &t );

  // 200 Hz component sits in the amplitude filter's stopband
  for (size_t i=0; i<f.size(); i++) f[i] += 30 * sin( 2 * M_PI * 200 * t[i] );
  
  force_result_t res = analyzer.analyze( f , t , 500 );
  EXPECT_NEAR( res.fmin , 400 , 2.0 );
  EXPECT_NEAR( res.fmax , 600 , 2.0 );
}
