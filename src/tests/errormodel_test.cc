/*
TEST: errormodel_test
PURPOSE: Gaussian error model gives bounded, monotone exceedance probabilities
and refuses unusable calibration at construction.
*/
#include <limits>

#include "errormodel.hh"
#include "riskerror.hh"
#include "test_common.hh"

using namespace AQRisk;

static int test_point_example( void )
{
  const ErrorModel model( ErrorModelParams( 5.08, 18.03 ) );

  /* 1 - Phi( (150 - 168 - 5.08) / 18.03 ) = 1 - Phi( -1.2801 ) */
  EXPECT_NEAR( model.exceedance_probability( 168, 150 ), 0.899743, 1e-5, "168 ppb peak against 150 ppb" );
  EXPECT_NEAR( model.exceedance_probability( 168, 120 ), 0.998380, 1e-5, "168 ppb peak against 120 ppb" );

  return 0;
}

static int test_centre_of_distribution( void )
{
  const ErrorModel model( ErrorModelParams( -0.43, 6.11 ) );

  /* threshold exactly at forecast + mu */
  EXPECT_NEAR( model.exceedance_probability( 50.43, 50 ), 0.5, 1e-12, "z = 0 gives one half" );

  return 0;
}

static int test_bounded( void )
{
  const ErrorModel model( ErrorModelParams( 5.08, 18.03 ) );

  for ( double predicted = 0; predicted <= 1000; predicted += 12.5 ) {
    for ( double threshold = -1000; threshold <= 2000; threshold += 25 ) {
      const double p = model.exceedance_probability( predicted, threshold );
      EXPECT( p >= 0.0 && p <= 1.0, "probability outside [0, 1]" );
    }
  }

  EXPECT( model.exceedance_probability( 0, 1e6 ) >= 0.0, "far upper tail stays non-negative" );
  EXPECT( model.exceedance_probability( 0, 1e6 ) < 1e-300, "far upper tail vanishes" );
  EXPECT( model.exceedance_probability( 1e6, 0 ) == 1.0, "far lower tail saturates at one" );

  return 0;
}

static int test_monotone_in_threshold( void )
{
  const ErrorModel model( ErrorModelParams( 5.08, 18.03 ) );

  double previous = 1.0;
  for ( double threshold = 0; threshold <= 300; threshold += 0.5 ) {
    const double p = model.exceedance_probability( 110, threshold );
    EXPECT( p <= previous, "raising the threshold raised the probability" );
    previous = p;
  }

  return 0;
}

static int test_rejects_bad_sigma( void )
{
  EXPECT_THROWS( (void) ErrorModel( ErrorModelParams( 0, 0 ) ), ConfigurationError, "zero sigma accepted" );
  EXPECT_THROWS( (void) ErrorModel( ErrorModelParams( 0, -6.11 ) ), ConfigurationError, "negative sigma accepted" );
  EXPECT_THROWS( (void) ErrorModel( ErrorModelParams( 0, std::numeric_limits< double >::quiet_NaN() ) ),
		 ConfigurationError, "NaN sigma accepted" );
  EXPECT_THROWS( (void) ErrorModel( ErrorModelParams( 0, std::numeric_limits< double >::infinity() ) ),
		 ConfigurationError, "infinite sigma accepted" );
  EXPECT_THROWS( (void) ErrorModel( ErrorModelParams( std::numeric_limits< double >::quiet_NaN(), 1 ) ),
		 ConfigurationError, "NaN mu accepted" );

  return 0;
}

static int test_rejects_nan_forecast( void )
{
  const ErrorModel model( ErrorModelParams( 5.08, 18.03 ) );

  EXPECT_THROWS( model.exceedance_probability( std::numeric_limits< double >::quiet_NaN(), 90 ),
		 OutOfDomainError, "NaN forecast accepted" );

  return 0;
}

int main( void )
{
  RUN( test_point_example );
  RUN( test_centre_of_distribution );
  RUN( test_bounded );
  RUN( test_monotone_in_threshold );
  RUN( test_rejects_bad_sigma );
  RUN( test_rejects_nan_forecast );

  printf( "errormodel_test passed\n" );
  return 0;
}
