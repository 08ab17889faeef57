/*
TEST: classification_test
PURPOSE: Air-quality bands classify boundary values exactly, give every
non-negative value one category, reject negative readings and malformed
tables.
*/
#include <limits>
#include <string>

#include "classification.hh"
#include "riskerror.hh"
#include "test_common.hh"

using namespace AQRisk;

static bool category_is( const ClassificationTable & table, const double value, const std::string & category )
{
  return table.classify( value ).category == category;
}

static int test_ozone_boundaries( void )
{
  const ClassificationTable ozone( ClassificationTable::ozone() );

  EXPECT( category_is( ozone, 0, "Buena" ), "0 ppb" );
  EXPECT( category_is( ozone, 57, "Buena" ), "57 ppb" );
  EXPECT( category_is( ozone, 57.5, "Buena" ), "57.5 ppb belongs to the lower band" );
  EXPECT( category_is( ozone, 58, "Aceptable" ), "58 ppb" );
  EXPECT( category_is( ozone, 89, "Aceptable" ), "89 ppb" );
  EXPECT( category_is( ozone, 90, "Mala" ), "90 ppb" );
  EXPECT( category_is( ozone, 134, "Mala" ), "134 ppb" );
  EXPECT( category_is( ozone, 135, "Muy Mala" ), "135 ppb" );
  EXPECT( category_is( ozone, 174.99, "Muy Mala" ), "174.99 ppb" );
  EXPECT( category_is( ozone, 175, "Extremadamente Mala" ), "175 ppb" );
  EXPECT( category_is( ozone, 1e9, "Extremadamente Mala" ), "top band is open-ended" );

  EXPECT( ozone.classify( 30 ).color == "green", "Buena is green" );
  EXPECT( ozone.classify( 60 ).color == "yellow", "Aceptable is yellow" );
  EXPECT( ozone.classify( 100 ).color == "orange", "Mala is orange" );
  EXPECT( ozone.classify( 150 ).color == "red", "Muy Mala is red" );
  EXPECT( ozone.classify( 200 ).color == "purple", "Extremadamente Mala is purple" );

  EXPECT( classify( 58, ozone ).category == "Aceptable", "free function agrees with the table" );

  return 0;
}

static int test_exactly_one_band( void )
{
  const ClassificationTable ozone( ClassificationTable::ozone() );
  const std::vector< ClassificationBand > & bands = ozone.bands();

  for ( double value = 0; value <= 300; value += 0.25 ) {
    const ClassificationResult result( ozone.classify( value ) );

    int owners = 0;
    for ( unsigned int i = 0; i < bands.size(); i++ ) {
      const bool above_lower = value >= bands[ i ].min_inclusive;
      const bool below_next = ( i + 1 == bands.size() ) || value < bands[ i + 1 ].min_inclusive;
      if ( above_lower && below_next ) {
	owners++;
	EXPECT( result.category == bands[ i ].category, "classified into a band that does not own the value" );
      }
    }
    EXPECT( owners == 1, "value owned by zero or several bands" );
  }

  return 0;
}

static int test_particulate_tables( void )
{
  const ClassificationTable pm10( ClassificationTable::for_pollutant( PM10 ) );
  EXPECT( category_is( pm10, 44, "Buena" ), "PM10 44" );
  EXPECT( category_is( pm10, 45, "Aceptable" ), "PM10 45" );
  EXPECT( category_is( pm10, 131, "Mala" ), "PM10 131" );
  EXPECT( category_is( pm10, 213, "Extremadamente Mala" ), "PM10 213" );

  const ClassificationTable pm25( ClassificationTable::for_pollutant( PM25 ) );
  EXPECT( category_is( pm25, 14.9, "Buena" ), "PM2.5 14.9" );
  EXPECT( category_is( pm25, 33, "Mala" ), "PM2.5 33" );
  EXPECT( category_is( pm25, 129, "Muy Mala" ), "PM2.5 129" );
  EXPECT( category_is( pm25, 130, "Extremadamente Mala" ), "PM2.5 130" );

  return 0;
}

static int test_rejects_negative( void )
{
  const ClassificationTable ozone( ClassificationTable::ozone() );

  EXPECT_THROWS( ozone.classify( -0.5 ), OutOfDomainError, "negative concentration accepted" );
  EXPECT_THROWS( ozone.classify( std::numeric_limits< double >::quiet_NaN() ), OutOfDomainError, "NaN accepted" );

  /* the table is untouched by the rejected call */
  EXPECT( ozone.bands().size() == 5, "band count changed" );
  EXPECT( category_is( ozone, 57, "Buena" ), "classification changed after a rejected call" );

  return 0;
}

static int test_rejects_malformed_tables( void )
{
  std::vector< ClassificationBand > overlapping;
  overlapping.push_back( ClassificationBand( "Buena", "green", 0, 60 ) );
  overlapping.push_back( ClassificationBand( "Mala", "orange", 58 ) );
  EXPECT_THROWS( ClassificationTable t( overlapping ), ConfigurationError, "overlapping bands accepted" );

  std::vector< ClassificationBand > gapped;
  gapped.push_back( ClassificationBand( "Buena", "green", 0, 57 ) );
  gapped.push_back( ClassificationBand( "Mala", "orange", 90 ) );
  EXPECT_THROWS( ClassificationTable t( gapped ), ConfigurationError, "gap between bands accepted" );

  std::vector< ClassificationBand > late_start;
  late_start.push_back( ClassificationBand( "Buena", "green", 10, 57 ) );
  late_start.push_back( ClassificationBand( "Mala", "orange", 58 ) );
  EXPECT_THROWS( ClassificationTable t( late_start ), ConfigurationError, "table not starting at 0 accepted" );

  std::vector< ClassificationBand > closed_top;
  closed_top.push_back( ClassificationBand( "Buena", "green", 0, 57 ) );
  closed_top.push_back( ClassificationBand( "Mala", "orange", 58, 500 ) );
  EXPECT_THROWS( ClassificationTable t( closed_top ), ConfigurationError, "bounded top band accepted" );

  std::vector< ClassificationBand > open_middle;
  open_middle.push_back( ClassificationBand( "Buena", "green", 0 ) );
  open_middle.push_back( ClassificationBand( "Mala", "orange", 58 ) );
  EXPECT_THROWS( ClassificationTable t( open_middle ), ConfigurationError, "open band below the top accepted" );

  EXPECT_THROWS( ClassificationTable t( ( std::vector< ClassificationBand >() ) ), ConfigurationError,
		 "empty table accepted" );

  return 0;
}

int main( void )
{
  RUN( test_ozone_boundaries );
  RUN( test_exactly_one_band );
  RUN( test_particulate_tables );
  RUN( test_rejects_negative );
  RUN( test_rejects_malformed_tables );

  printf( "classification_test passed\n" );
  return 0;
}
