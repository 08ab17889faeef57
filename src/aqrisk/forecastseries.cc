#include <cmath>
#include <string>

#include "forecastseries.hh"
#include "riskerror.hh"

using namespace AQRisk;

const int ForecastSeries::HORIZON;

ForecastSeries::ForecastSeries( const std::vector< std::pair< int, double > > & points )
  : _values()
{
  if ( points.size() != static_cast< size_t >( HORIZON ) ) {
    throw InputShapeError( "ForecastSeries", "expected " + std::to_string( HORIZON )
			   + " hourly points, got " + std::to_string( points.size() ) );
  }

  for ( unsigned int i = 0; i < points.size(); i++ ) {
    const int expected_hour = i + 1;
    if ( points[ i ].first != expected_hour ) {
      throw InputShapeError( "ForecastSeries", "hour offset " + std::to_string( points[ i ].first )
			     + " at position " + std::to_string( i )
			     + ", expected " + std::to_string( expected_hour ) );
    }
    _values.push_back( points[ i ].second );
  }

  check_values();
}

ForecastSeries::ForecastSeries( const std::vector< double > & hourly_values )
  : _values( hourly_values )
{
  if ( _values.size() != static_cast< size_t >( HORIZON ) ) {
    throw InputShapeError( "ForecastSeries", "expected " + std::to_string( HORIZON )
			   + " hourly points, got " + std::to_string( _values.size() ) );
  }

  check_values();
}

void ForecastSeries::check_values( void ) const
{
  for ( unsigned int i = 0; i < _values.size(); i++ ) {
    if ( !std::isfinite( _values[ i ] ) ) {
      throw InputShapeError( "ForecastSeries", "non-finite value at hour " + std::to_string( i + 1 ) );
    }
  }
}

double ForecastSeries::at_hour( const int hour ) const
{
  if ( hour < 1 || hour > HORIZON ) {
    throw InputShapeError( "ForecastSeries::at_hour", "hour " + std::to_string( hour ) + " outside 1.."
			   + std::to_string( HORIZON ) );
  }

  return _values[ hour - 1 ];
}

double ForecastSeries::maximum( void ) const
{
  return _values[ peak_hour() - 1 ];
}

int ForecastSeries::peak_hour( void ) const
{
  unsigned int best = 0;

  for ( unsigned int i = 1; i < _values.size(); i++ ) {
    if ( _values[ i ] > _values[ best ] ) {
      best = i;
    }
  }

  return best + 1;
}
