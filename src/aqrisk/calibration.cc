#include <cmath>
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/text_format.h>

#include "calibration.hh"
#include "riskerror.hh"

using namespace AQRisk;

static const Pollutant ALL_POLLUTANTS[] = { OZONE, PM10, PM25 };

std::vector< Threshold > Calibration::default_thresholds( void )
{
  std::vector< Threshold > ret;
  ret.push_back( Threshold( 50, "Media de más de 50 ppb en 8hrs", MOVING_AVERAGE_8H ) );
  ret.push_back( Threshold( 90, "Umbral de 90 ppb", POINT ) );
  ret.push_back( Threshold( 120, "Umbral de 120 ppb", POINT ) );
  ret.push_back( Threshold( 150, "Umbral de 150 ppb", POINT ) );
  return ret;
}

Calibration::Calibration( const Proto::Calibration & stored )
  : _point_error( stored.has_point_error()
		  ? ErrorModelParams( stored.point_error() )
		  : default_point_error() ),
    _moving_average_error( stored.has_moving_average_error()
			   ? ErrorModelParams( stored.moving_average_error() )
			   : default_moving_average_error() ),
    _thresholds(),
    _severity( stored.medium_severity_from(), stored.high_severity_above() ),
    _band_tables()
{
  for ( int i = 0; i < stored.thresholds_size(); i++ ) {
    const Threshold threshold( stored.thresholds( i ) );
    if ( !std::isfinite( threshold.value ) || threshold.value < 0 ) {
      throw ConfigurationError( "Calibration", "threshold \"" + threshold.label + "\" must be a non-negative number" );
    }
    _thresholds.push_back( threshold );
  }
  if ( _thresholds.empty() ) {
    _thresholds = default_thresholds();
  }

  for ( int i = 0; i < stored.band_tables_size(); i++ ) {
    const Proto::BandTable & table = stored.band_tables( i );

    Pollutant pollutant;
    if ( !parse_pollutant( table.pollutant(), pollutant ) ) {
      throw ConfigurationError( "Calibration", "band table for unknown pollutant \"" + table.pollutant() + "\"" );
    }

    if ( !_band_tables.insert( std::make_pair( pollutant, ClassificationTable( table ) ) ).second ) {
      throw ConfigurationError( "Calibration", "duplicate band table for " + table.pollutant() );
    }
  }

  for ( auto pollutant : ALL_POLLUTANTS ) {
    if ( _band_tables.find( pollutant ) == _band_tables.end() ) {
      _band_tables.insert( std::make_pair( pollutant, ClassificationTable::for_pollutant( pollutant ) ) );
    }
  }
}

Calibration Calibration::defaults( void )
{
  return Calibration( Proto::Calibration() );
}

Calibration Calibration::from_text( const std::string & text )
{
  Proto::Calibration stored;
  if ( !google::protobuf::TextFormat::ParseFromString( text, &stored ) ) {
    throw ConfigurationError( "Calibration::from_text", "could not parse calibration" );
  }

  return Calibration( stored );
}

Calibration Calibration::load( const std::string & filename )
{
  int fd = open( filename.c_str(), O_RDONLY );
  if ( fd < 0 ) {
    throw ConfigurationError( "Calibration::load", "could not open " + filename + ": " + strerror( errno ) );
  }

  Proto::Calibration stored;
  bool parsed;
  {
    google::protobuf::io::FileInputStream input( fd );
    parsed = google::protobuf::TextFormat::Parse( &input, &stored );
  }

  if ( close( fd ) < 0 ) {
    throw ConfigurationError( "Calibration::load", "could not close " + filename + ": " + strerror( errno ) );
  }

  if ( !parsed ) {
    throw ConfigurationError( "Calibration::load", "could not parse " + filename );
  }

  return Calibration( stored );
}

const ErrorModel & Calibration::error_model( const AggregationMode mode ) const
{
  return mode == MOVING_AVERAGE_8H ? _moving_average_error : _point_error;
}

const ClassificationTable & Calibration::band_table( const Pollutant pollutant ) const
{
  auto it = _band_tables.find( pollutant );
  if ( it == _band_tables.end() ) {
    throw ConfigurationError( "Calibration::band_table", std::string( "no band table for " )
			      + pollutant_name( pollutant ) );
  }

  return it->second;
}

Proto::Calibration Calibration::to_protobuf( void ) const
{
  Proto::Calibration ret;

  *ret.mutable_point_error() = _point_error.params().to_protobuf();
  *ret.mutable_moving_average_error() = _moving_average_error.params().to_protobuf();

  for ( auto it = _thresholds.begin(); it != _thresholds.end(); it++ ) {
    *ret.add_thresholds() = it->to_protobuf();
  }

  ret.set_medium_severity_from( _severity.medium_from() );
  ret.set_high_severity_above( _severity.high_above() );

  for ( auto it = _band_tables.begin(); it != _band_tables.end(); it++ ) {
    *ret.add_band_tables() = it->second.to_protobuf( it->first );
  }

  return ret;
}
