
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
#include <limits>

#include "egea/signal.h"
#include "egea/validate.h"
#include "test-util.h"

//
// Static-weight crossings and fref
//

TEST( CrossingTest , InterpolatesStrictCrossings )
{
  std::vector<double> f = { 4 , 6 , 6 , 4 , 4 , 6 };
  std::vector<double> t = { 0 , 1 , 2 , 3 , 4 , 5 };
  
  std::vector<egea::crossing_t> c = egea::find_static_weight_crossings( f , t , 5 );
  ASSERT_EQ( c.size() , 3u );
  EXPECT_DOUBLE_EQ( c[0].time , 0.5 );
  EXPECT_EQ( c[0].dir , egea::CROSS_UP );
  EXPECT_DOUBLE_EQ( c[1].time , 2.5 );
  EXPECT_EQ( c[1].dir , egea::CROSS_DOWN );
  EXPECT_DOUBLE_EQ( c[2].time , 4.5 );
  EXPECT_EQ( c[2].dir , egea::CROSS_UP );
}

TEST( CrossingTest , SampleOnStaticWeightIsNotACrossing )
{
  std::vector<double> f = { 4 , 5 , 6 };
  std::vector<double> t = { 0 , 1 , 2 };
  EXPECT_EQ( egea::find_static_weight_crossings( f , t , 5 ).size() , 0u );
}

TEST( CrossingTest , UnevenInterpolation )
{
  std::vector<double> f = { 0 , 10 };
  std::vector<double> t = { 1.0 , 1.1 };
  std::vector<egea::crossing_t> c = egea::find_static_weight_crossings( f , t , 2.5 );
  ASSERT_EQ( c.size() , 1u );
  EXPECT_NEAR( c[0].time , 1.025 , 1e-12 );
}

TEST( FrefTest , MidpointOfFirstDownAndFirstUp )
{
  std::vector<double> f = { 4 , 6 , 6 , 4 , 4 , 6 };
  std::vector<double> t = { 0 , 1 , 2 , 3 , 4 , 5 };
  
  std::optional<double> fref = egea::calculate_fref( f , t , 5 );
  ASSERT_TRUE( fref.has_value() );
  EXPECT_DOUBLE_EQ( *fref , 1.5 );

  std::optional<egea::fref_t> r = egea::locate_fref( f , t , 5 );
  ASSERT_TRUE( r.has_value() );
  EXPECT_FALSE( r->low_lobe ) << "up came first: midpoint of the high lobe";
}

TEST( FrefTest , TroughLobeWhenDownComesFirst )
{
  std::vector<double> f = { 6 , 4 , 4 , 6 , 6 };
  std::vector<double> t = { 0 , 1 , 2 , 3 , 4 };
  std::optional<egea::fref_t> r = egea::locate_fref( f , t , 5 );
  ASSERT_TRUE( r.has_value() );
  EXPECT_DOUBLE_EQ( r->time , 1.5 );
  EXPECT_TRUE( r->low_lobe );
}

TEST( FrefTest , FallsBackToFirstTwoCrossings )
{
  // two rising crossings, no falling one
  std::vector<double> f = { 4 , 6 , 5 , 4 , 6 };
  std::vector<double> t = { 0 , 1 , 2 , 3 , 4 };
  std::optional<double> fref = egea::calculate_fref( f , t , 5 );
  ASSERT_TRUE( fref.has_value() );
  EXPECT_DOUBLE_EQ( *fref , 2.0 );

  std::optional<egea::fref_t> r = egea::locate_fref( f , t , 5 );
  ASSERT_TRUE( r.has_value() );
  EXPECT_FALSE( r->low_lobe );
}

TEST( FrefTest , TwoFallingCrossingsAreNotATrough )
{
  // the rise back to Fst ends exactly on a sample, so only the two
  // falling crossings are seen
  std::vector<double> f = { 6 , 4 , 5 , 6 , 4 };
  std::vector<double> t = { 0 , 1 , 2 , 3 , 4 };

  std::vector<egea::crossing_t> c = egea::find_static_weight_crossings( f , t , 5 );
  ASSERT_EQ( c.size() , 2u );
  EXPECT_EQ( c[0].dir , egea::CROSS_DOWN );
  EXPECT_EQ( c[1].dir , egea::CROSS_DOWN );

  std::optional<egea::fref_t> r = egea::locate_fref( f , t , 5 );
  ASSERT_TRUE( r.has_value() );
  EXPECT_DOUBLE_EQ( r->time , 2.0 );
  EXPECT_FALSE( r->low_lobe );
}

TEST( FrefTest , NoneWithFewerThanTwoCrossings )
{
  std::vector<double> f = { 4 , 6 , 7 , 8 };
  std::vector<double> t = { 0 , 1 , 2 , 3 };
  EXPECT_FALSE( egea::calculate_fref( f , t , 5 ).has_value() );
  EXPECT_FALSE( egea::calculate_fref( std::vector<double>() , std::vector<double>() , 5 ).has_value() );
}


//
// RFst guard
//

TEST( RfstTest , StaticWeightMustSitInsideBand )
{
  egea_param_t p;
  std::vector<double> f = { 0 , 100 , 50 };
  EXPECT_TRUE( egea::validate_rfst_conditions( f , 50 , p ) );
  EXPECT_FALSE( egea::validate_rfst_conditions( f , 20 , p ) );
  EXPECT_FALSE( egea::validate_rfst_conditions( f , 80 , p ) );
  // bounds are strict
  EXPECT_FALSE( egea::validate_rfst_conditions( f , 25 , p ) );
  EXPECT_FALSE( egea::validate_rfst_conditions( f , 75 , p ) );
  EXPECT_FALSE( egea::validate_rfst_conditions( std::vector<double>() , 50 , p ) );
}

TEST( RfstTest , PercentagesAreConfigurable )
{
  egea_param_t p;
  p.rfst_fmin_pct = 10;
  p.rfst_fmax_pct = 10;
  std::vector<double> f = { 0 , 100 };
  EXPECT_TRUE( egea::validate_rfst_conditions( f , 20 , p ) );
  EXPECT_FALSE( egea::validate_rfst_conditions( f , 5 , p ) );
}


//
// Phase normalisation, saturation flags, rates
//

TEST( SignalTest , NormalizePhaseFoldsIntoHalfCircle )
{
  EXPECT_DOUBLE_EQ( egea::normalize_phase( 40 ) , 40 );
  EXPECT_DOUBLE_EQ( egea::normalize_phase( 400 ) , 40 );
  EXPECT_DOUBLE_EQ( egea::normalize_phase( -30 ) , 30 );
  EXPECT_DOUBLE_EQ( egea::normalize_phase( 190 ) , 170 );
  EXPECT_DOUBLE_EQ( egea::normalize_phase( 180 ) , 180 );
  EXPECT_DOUBLE_EQ( egea::normalize_phase( 720 ) , 0 );

  for ( double d = -1000 ; d < 1000 ; d += 7.3 )
    {
      const double p = egea::normalize_phase( d );
      EXPECT_GE( p , 0.0 );
      EXPECT_LE( p , 180.0 );
    }
}

TEST( SignalTest , UnderflowAndOverflowFlags )
{
  egea_param_t p;
  bool under , over;

  std::vector<double> ok = { 100 , 300 , 900 };
  egea::detect_signal_overflow_underflow( ok , 500 , p , &under , &over );
  EXPECT_FALSE( under );
  EXPECT_FALSE( over ) << "no over limit configured";

  std::vector<double> low = { 2 , 3 , 4 };
  egea::detect_signal_overflow_underflow( low , 500 , p , &under , &over );
  EXPECT_TRUE( under );
  EXPECT_FALSE( over );

  p.f_over_lim = 800;
  egea::detect_signal_overflow_underflow( ok , 500 , p , &under , &over );
  EXPECT_FALSE( under );
  EXPECT_TRUE( over );
}

TEST( SignalTest , CycleFrequencyAndSampleRate )
{
  std::vector<double> t( 1001 );
  for (int i=0; i<=1000; i++) t[i] = i / 500.0;

  EXPECT_NEAR( egea::estimate_sample_rate( t ) , 500.0 , 1e-9 );
  EXPECT_NEAR( egea::cycle_frequency( t , 100 , 150 ) , 10.0 , 1e-9 );
  EXPECT_DOUBLE_EQ( egea::cycle_frequency( t , 150 , 100 ) , 0 );
  EXPECT_DOUBLE_EQ( egea::cycle_frequency( t , 0 , 5000 ) , 0 );
  EXPECT_DOUBLE_EQ( egea::estimate_sample_rate( std::vector<double>( 1 , 0.0 ) ) , 0 );
}


//
// Platform TOPs
//

TEST( TopsTest , OneTopPerCycle )
{
  egea_param_t p;
  tone_t tone = make_tone( 10 , 0 , 1.0 );
  
  std::vector<int> tops = egea::find_platform_tops( tone.position , p , 27 );
  ASSERT_EQ( tops.size() , 10u );
  for (int i=0; i<10; i++)
    EXPECT_EQ( tops[i] , 25 + 100 * i );

  // length-based default distance agrees on a short trace
  EXPECT_EQ( egea::find_platform_tops( tone.position , p ) , tops );
}

TEST( TopsTest , SmallRipplesAreNotTops )
{
  egea_param_t p;
  tone_t tone = make_tone( 8 , 0 , 2.0 );
  
  // a small 120 Hz ripple adds spurious local maxima around each top
  std::vector<double> x = tone.position;
  for (size_t i=0; i<x.size(); i++) 
    x[i] += 0.015 * sin( 2 * M_PI * 120 * tone.time[i] );
  
  std::vector<int> tops = egea::find_platform_tops( x , p , 27 );
  EXPECT_EQ( tops.size() , 16u );
  for (size_t i=1; i<tops.size(); i++)
    EXPECT_NEAR( tops[i] - tops[i-1] , 125 , 2 );
}

TEST( TopsTest , ConstantSignalHasNoTops )
{
  egea_param_t p;
  std::vector<double> x( 500 , 1.0 );
  EXPECT_EQ( egea::find_platform_tops( x , p ).size() , 0u );
}


//
// Input validation
//

static std::string first_error( const tone_t & t , double fst = 500.0 )
{
  egea_param_t p;
  return egea::validate_sample_set( t.time , t.position , t.force , fst , p );
}

TEST( ValidateTest , AcceptsCleanInput )
{
  EXPECT_EQ( first_error( make_tone( 10 , 30 ) ) , "" );
}

TEST( ValidateTest , LengthMismatch )
{
  tone_t t = make_tone( 10 , 30 );
  t.force.pop_back();
  EXPECT_NE( first_error( t ).find( "length mismatch" ) , std::string::npos );
}

TEST( ValidateTest , NonMonotonicTime )
{
  tone_t t = make_tone( 10 , 30 );
  t.time[500] = t.time[499];
  EXPECT_NE( first_error( t ).find( "strictly increasing" ) , std::string::npos );
}

TEST( ValidateTest , NonPositiveStaticWeight )
{
  tone_t t = make_tone( 10 , 30 );
  EXPECT_NE( first_error( t , 0 ).find( "static weight" ) , std::string::npos );
  EXPECT_NE( first_error( t , -10 ).find( "static weight" ) , std::string::npos );
}

TEST( ValidateTest , TooFewSamples )
{
  tone_t t = make_tone( 10 , 30 , 0.0505 );
  ASSERT_EQ( t.time.size() , 50u );
  EXPECT_NE( first_error( t ).find( "too few samples" ) , std::string::npos );
}

TEST( ValidateTest , NonFiniteValues )
{
  tone_t t = make_tone( 10 , 30 );
  t.force[10] = std::numeric_limits<double>::quiet_NaN();
  EXPECT_NE( first_error( t ).find( "non-finite" ) , std::string::npos );
}

TEST( ValidateTest , SampleRateOutOfRange )
{
  tone_t t = make_tone( 2 , 30 , 20.0 , 20.0 );
  EXPECT_NE( first_error( t ).find( "sample rate" ) , std::string::npos );
}
