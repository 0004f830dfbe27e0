
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
#include <algorithm>

#include "egea/phase.h"
#include "dsp/siggen.h"
#include "test-util.h"

//
// tops fall between samples (t0), so no crossing lands exactly on a
// sample; the period is a whole number of samples
//

static const double T0 = 0.0003;


TEST( PhaseShiftTest , RecoversKnownPhase )
{
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );
  
  for ( double frq : { 8.0 , 10.0 , 12.5 } )
    for ( double lag : { 0.0 , 30.0 , 45.0 , 60.0 , 90.0 } )
      {
	tone_t t = make_tone( frq , lag , 2.0 , 1000 , 500 , 200 , 3 , T0 );
	phase_result_t res = analyzer.analyze( t.position , t.force , t.time , 500 );
	
	ASSERT_TRUE( res.is_valid() ) << frq << " Hz , " << lag << " deg";
	ASSERT_TRUE( res.min_phase_shift.has_value() );
	EXPECT_NEAR( *res.min_phase_shift , lag , 5.0 ) << frq << " Hz";
	EXPECT_NEAR( *res.min_phase_frequency , frq , 0.05 );
	
	for (size_t i=0; i<res.periods.size(); i++)
	  {
	    EXPECT_NEAR( res.periods[i].phase_shift , lag , 5.0 );
	    EXPECT_TRUE( res.periods[i].is_valid );
	  }
      }
}

TEST( PhaseShiftTest , RecoversKnownPhaseOnSampleGrid )
{
  // no offset: TOPs and some Fst crossings fall exactly on samples
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );
  
  for ( double frq : { 6.0 , 10.0 , 12.0 , 18.0 } )
    for ( double lag : { 0.0 , 30.0 , 45.0 , 60.0 , 90.0 , -30.0 , -45.0 , -60.0 , -90.0 } )
      {
	tone_t t = make_tone( frq , lag , 2.0 );
	phase_result_t res = analyzer.analyze( t.position , t.force , t.time , 500 );
	
	ASSERT_TRUE( res.is_valid() ) << frq << " Hz , " << lag << " deg";
	EXPECT_NEAR( *res.min_phase_shift , fabs( lag ) , 5.0 ) << frq << " Hz , " << lag << " deg";
	EXPECT_NEAR( *res.min_phase_frequency , frq , 0.25 );
      }
}

TEST( PhaseShiftTest , ForceOnStaticWeightAtTop )
{
  // force leads by 90 deg, so it passes Fst at every TOP and, on some
  // cycles, mid-cycle exactly on a sample
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );
  tone_t t = make_tone( 18 , -90 , 3.0 );
  phase_result_t res = analyzer.analyze( t.position , t.force , t.time , 500 );
  
  ASSERT_TRUE( res.is_valid() );
  EXPECT_GT( res.periods.size() , 20u );
  EXPECT_NEAR( *res.min_phase_shift , 90 , 5.0 );
  for (size_t i=0; i<res.periods.size(); i++)
    EXPECT_NEAR( res.periods[i].phase_shift , 90 , 5.0 ) << "cycle " << res.periods[i].period_index;
}

TEST( PhaseShiftTest , LeadingForceGivesSamePhase )
{
  // the phase is folded onto [0,180]: lead and lag look alike
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );
  tone_t t = make_tone( 10 , -50 , 2.0 , 1000 , 500 , 200 , 3 , T0 );
  phase_result_t res = analyzer.analyze( t.position , t.force , t.time , 500 );
  ASSERT_TRUE( res.min_phase_shift.has_value() );
  EXPECT_NEAR( *res.min_phase_shift , 50 , 5.0 );
}

TEST( PhaseShiftTest , PeriodFieldsAreFilled )
{
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );
  tone_t t = make_tone( 10 , 40 , 2.0 , 1000 , 500 , 200 , 3 , T0 );
  phase_result_t res = analyzer.analyze( t.position , t.force , t.time , 500 );

  ASSERT_GT( res.periods.size() , 10u );
  EXPECT_EQ( res.n_cycles , 19 );

  int last = -1;
  for (size_t i=0; i<res.periods.size(); i++)
    {
      const phase_period_t & pp = res.periods[i];
      EXPECT_GT( pp.period_index , last );
      last = pp.period_index;
      EXPECT_NEAR( pp.max_force , 700 , 1.0 );
      EXPECT_NEAR( pp.min_force , 300 , 1.0 );
      EXPECT_DOUBLE_EQ( pp.delta_force , pp.max_force - pp.min_force );
      EXPECT_DOUBLE_EQ( pp.static_weight , 500 );
      EXPECT_GE( pp.fref , 0 );
      EXPECT_LE( pp.fref , 1.0 / pp.frequency + 1e-9 );
      EXPECT_GE( pp.top_p , 0 );
    }
}

TEST( PhaseShiftTest , RfaFromSquareForceIsExact )
{
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );

  const double fst = 500 , b = 150;
  tone_t t = make_tone( 10 , 40 , 2.0 , 1000 , fst , b , 3 , T0 );
  for (size_t i=0; i<t.force.size(); i++)
    t.force[i] = t.force[i] >= fst ? fst + b : fst - b;
  
  phase_result_t res = analyzer.analyze( t.position , t.force , t.time , fst );
  ASSERT_TRUE( res.rfa_max_value.has_value() );
  EXPECT_NEAR( *res.rfa_max_value , b / fst * 100.0 , 1e-9 );
  EXPECT_NEAR( *res.rfa_max_frequency , 10 , 0.05 );
  EXPECT_NEAR( *res.min_phase_shift , 40 , 5.0 );
}

TEST( PhaseShiftTest , DeterministicOnNoisySweep )
{
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );

  sweep_param_t sp;
  sp.noise_sd = 10;
  sweep_t s = dsptools::simulate_sweep( sp );

  phase_result_t a = analyzer.analyze( s.position , s.force , s.time , s.static_weight );
  phase_result_t b = analyzer.analyze( s.position , s.force , s.time , s.static_weight );

  ASSERT_EQ( a.periods.size() , b.periods.size() );
  ASSERT_GT( a.periods.size() , 0u );
  for (size_t i=0; i<a.periods.size(); i++)
    {
      EXPECT_EQ( a.periods[i].period_index , b.periods[i].period_index );
      EXPECT_NEAR( a.periods[i].frequency , b.periods[i].frequency , 1e-9 );
      EXPECT_NEAR( a.periods[i].phase_shift , b.periods[i].phase_shift , 1e-9 );
      EXPECT_NEAR( a.periods[i].fref , b.periods[i].fref , 1e-9 );
      EXPECT_NEAR( a.periods[i].top_p , b.periods[i].top_p , 1e-9 );
    }
  ASSERT_TRUE( a.min_phase_shift.has_value() );
  EXPECT_NEAR( *a.min_phase_shift , *b.min_phase_shift , 1e-9 );
  EXPECT_NEAR( *a.rfa_max_value , *b.rfa_max_value , 1e-9 );
  EXPECT_EQ( a.f_under_flag , b.f_under_flag );
  EXPECT_EQ( a.f_over_flag , b.f_over_flag );
  EXPECT_EQ( a.curve.phase , b.curve.phase );
}

TEST( PhaseShiftTest , SweepAggregates )
{
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );

  sweep_param_t sp;
  sweep_t s = dsptools::simulate_sweep( sp );
  phase_result_t res = analyzer.analyze( s.position , s.force , s.time , s.static_weight );

  ASSERT_TRUE( res.is_valid() );
  EXPECT_NEAR( *res.min_phase_shift , 40 , 5.0 );

  // all retained cycles are inside the window
  for (size_t i=0; i<res.periods.size(); i++)
    {
      EXPECT_GE( res.periods[i].frequency , p.min_calc_freq );
      EXPECT_LE( res.periods[i].frequency , p.max_calc_freq );
    }
  EXPECT_GT( res.n_cycles , (int)res.periods.size() ) << "cycles above 18 Hz and below 6 Hz are dropped";

  // a period close to 18 Hz
  ASSERT_TRUE( res.max_phase_shift.has_value() );
  EXPECT_NEAR( *res.max_phase_shift , 40 , 8.0 );

  EXPECT_NEAR( *res.rfa_max_value , 40.0 , 0.5 );
}

TEST( PhaseShiftTest , PhaseNear18HzTakesTheNearestPeriod )
{
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );

  sweep_param_t sp;
  sweep_t s = dsptools::simulate_sweep( sp );
  phase_result_t res = analyzer.analyze( s.position , s.force , s.time , s.static_weight );
  ASSERT_TRUE( res.max_phase_shift.has_value() );

  // first period closest to max_calc_freq, within tolerance
  int inear = -1;
  for (size_t i=0; i<res.periods.size(); i++)
    {
      const double d = fabs( res.periods[i].frequency - p.max_calc_freq );
      if ( d > p.phase_near_18_tol ) continue;
      if ( inear == -1 || d < fabs( res.periods[inear].frequency - p.max_calc_freq ) ) inear = i;
    }
  ASSERT_NE( inear , -1 );
  EXPECT_DOUBLE_EQ( *res.max_phase_shift , res.periods[inear].phase_shift );
}

TEST( PhaseShiftTest , NoCyclesInWindow )
{
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );

  for ( double frq : { 3.0 , 25.0 } )
    {
      tone_t t = make_tone( frq , 40 , 4.0 , 1000 , 500 , 200 , 3 , T0 );
      phase_result_t res = analyzer.analyze( t.position , t.force , t.time , 500 );
      EXPECT_FALSE( res.is_valid() ) << frq << " Hz";
      EXPECT_FALSE( res.min_phase_shift.has_value() );
      EXPECT_FALSE( res.max_phase_shift.has_value() );
      EXPECT_FALSE( res.rfa_max_value.has_value() );
      EXPECT_EQ( res.periods.size() , 0u );
      EXPECT_GT( res.n_cycles , 0 );
      EXPECT_EQ( res.error , "" ) << "dropped cycles are not an input error";
    }
}

TEST( PhaseShiftTest , FlatPlatformGivesEmptyResult )
{
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );
  tone_t t = make_tone( 10 , 40 );
  std::fill( t.position.begin() , t.position.end() , 0.0 );
  phase_result_t res = analyzer.analyze( t.position , t.force , t.time , 500 );
  EXPECT_FALSE( res.is_valid() );
  EXPECT_EQ( res.n_cycles , 0 );
  EXPECT_EQ( res.periods.size() , 0u );
}

TEST( PhaseShiftTest , ForceBelowUnderLimitSetsFlag )
{
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );

  // whole trace under f_under_lim( 500 ) = 5 N
  tone_t t = make_tone( 10 , 40 , 2.0 , 1000 , 3 , 1 , 3 , T0 );
  phase_result_t res = analyzer.analyze( t.position , t.force , t.time , 500 );
  EXPECT_TRUE( res.f_under_flag );
  EXPECT_FALSE( res.f_over_flag );
  EXPECT_FALSE( res.is_valid() );
}

TEST( PhaseShiftTest , UnderflowInvalidatesOtherwiseGoodPeriods )
{
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );

  // dips to 2 N, below 5 N
  tone_t t = make_tone( 10 , 40 , 2.0 , 1000 , 500 , 498 , 3 , T0 );
  phase_result_t res = analyzer.analyze( t.position , t.force , t.time , 500 );
  EXPECT_TRUE( res.f_under_flag );
  EXPECT_GT( res.periods.size() , 0u );
  EXPECT_TRUE( res.min_phase_shift.has_value() );
  EXPECT_FALSE( res.is_valid() );
}

TEST( PhaseShiftTest , OverLimitSetsFlagOnlyWhenConfigured )
{
  tone_t t = make_tone( 10 , 40 , 2.0 , 1000 , 500 , 200 , 3 , T0 );

  egea_param_t p;
  phase_result_t r1 = phase_shift_analyzer_t( p ).analyze( t.position , t.force , t.time , 500 );
  EXPECT_FALSE( r1.f_over_flag );
  
  p.f_over_lim = 650;
  phase_result_t r2 = phase_shift_analyzer_t( p ).analyze( t.position , t.force , t.time , 500 );
  EXPECT_TRUE( r2.f_over_flag );
  EXPECT_TRUE( r2.is_valid() ) << "overflow alone does not invalidate the phase result";
}

TEST( PhaseShiftTest , InvalidInputCarriesMessage )
{
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );
  tone_t t = make_tone( 10 , 40 );
  
  t.position.resize( 1500 );
  phase_result_t res = analyzer.analyze( t.position , t.force , t.time , 500 );
  EXPECT_FALSE( res.is_valid() );
  EXPECT_NE( res.error , "" );
  EXPECT_EQ( res.periods.size() , 0u );

  tone_t t2 = make_tone( 10 , 40 );
  phase_result_t res2 = analyzer.analyze( t2.position , t2.force , t2.time , 0 );
  EXPECT_FALSE( res2.is_valid() );
  EXPECT_NE( res2.error.find( "static weight" ) , std::string::npos );
}

TEST( PhaseShiftTest , RfstGuardDropsOffCentreCycles )
{
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );
  tone_t t = make_tone( 10 , 40 , 2.0 , 1000 , 500 , 200 , 3 , T0 );
  
  // the static weight sits at the top of the force range
  phase_result_t res = analyzer.analyze( t.position , t.force , t.time , 650 );
  EXPECT_EQ( res.periods.size() , 0u );
  EXPECT_FALSE( res.is_valid() );
}


//
// Phase curve
//

TEST( PhaseCurveTest , GridAndSmoothing )
{
  egea_param_t p;
  phase_shift_analyzer_t analyzer( p );
  sweep_param_t sp;
  sweep_t s = dsptools::simulate_sweep( sp );
  phase_result_t res = analyzer.analyze( s.position , s.force , s.time , s.static_weight );
  
  const phase_curve_t & c = res.curve;
  ASSERT_GT( c.frq.size() , 10u );
  ASSERT_EQ( c.frq.size() , c.phase.size() );
  
  double fmin = 1e9 , fmax = 0;
  for (size_t i=0; i<res.periods.size(); i++)
    {
      fmin = std::min( fmin , res.periods[i].frequency );
      fmax = std::max( fmax , res.periods[i].frequency );
    }
  
  EXPECT_GE( c.frq.front() , fmin - 1e-9 );
  EXPECT_LE( c.frq.back() , fmax + 1e-9 );

  for (size_t i=1; i<c.frq.size(); i++)
    EXPECT_NEAR( c.frq[i] - c.frq[i-1] , p.curve_step , 1e-9 );
  
  for (size_t i=0; i<c.phase.size(); i++)
    EXPECT_NEAR( c.phase[i] , 40 , 6.0 );
}

TEST( PhaseCurveTest , EmptyWithFewerThanTwoPeriods )
{
  egea_param_t p;
  std::vector<phase_period_t> periods( 1 );
  periods[0].frequency = 10;
  periods[0].phase_shift = 40;
  periods[0].is_valid = true;
  phase_curve_t c = egea::phase_curve( periods , p );
  EXPECT_EQ( c.frq.size() , 0u );
}

TEST( PhaseCurveTest , InterpolatesBetweenPeriods )
{
  egea_param_t p;
  p.smooth_order = 0;
  std::vector<phase_period_t> periods( 2 );
  periods[0].frequency = 10;  periods[0].phase_shift = 40;  periods[0].is_valid = true;
  periods[1].frequency = 8;   periods[1].phase_shift = 60;  periods[1].is_valid = true;
  
  phase_curve_t c = egea::phase_curve( periods , p );
  ASSERT_EQ( c.frq.size() , 21u );
  EXPECT_NEAR( c.frq[0] , 8.0 , 1e-9 );
  EXPECT_NEAR( c.phase[0] , 60.0 , 1e-9 );
  EXPECT_NEAR( c.phase[10] , 50.0 , 1e-6 );
  EXPECT_NEAR( c.phase[20] , 40.0 , 1e-6 );
}
