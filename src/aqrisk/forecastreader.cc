#include <stdlib.h>
#include <algorithm>
#include <ctype.h>
#include <sstream>

#include "forecastreader.hh"
#include "riskerror.hh"

using namespace AQRisk;

static std::string trim( const std::string & s )
{
  const size_t begin = s.find_first_not_of( " \t\r\n" );
  if ( begin == std::string::npos ) {
    return "";
  }
  const size_t end = s.find_last_not_of( " \t\r\n" );
  return s.substr( begin, end - begin + 1 );
}

static bool is_header( const std::string & line )
{
  std::string head( line.substr( 0, 7 ) );
  std::transform( head.begin(), head.end(), head.begin(), ::tolower );
  return head == "station";
}

ForecastReader::ForecastReader( std::istream & s_in, const Pollutant s_pollutant )
  : _in( s_in ),
    _pollutant( s_pollutant ),
    _line_number( 0 )
{}

double ForecastReader::parse_value( const std::string & field, const unsigned int line_number, const int hour )
{
  const std::string text( trim( field ) );
  char *end = NULL;
  const double value = strtod( text.c_str(), &end );

  if ( text.empty() || end == NULL || *end != '\0' ) {
    throw InputShapeError( "ForecastReader", "line " + std::to_string( line_number )
			   + ": hour " + std::to_string( hour ) + " value \"" + text + "\" is not a number" );
  }

  return value;
}

bool ForecastReader::next( std::vector< StationForecast > & out )
{
  std::string line;

  while ( std::getline( _in, line ) ) {
    _line_number++;

    line = trim( line );
    if ( line.empty() || ( _line_number == 1 && is_header( line ) ) ) {
      continue;
    }

    std::vector< std::string > fields;
    std::stringstream ss( line );
    std::string field;
    while ( std::getline( ss, field, ',' ) ) {
      fields.push_back( field );
    }
    if ( !line.empty() && line[ line.size() - 1 ] == ',' ) {
      fields.push_back( "" );
    }

    if ( fields.size() != static_cast< size_t >( 1 + ForecastSeries::HORIZON ) ) {
      throw InputShapeError( "ForecastReader", "line " + std::to_string( _line_number ) + ": expected station and "
			     + std::to_string( ForecastSeries::HORIZON ) + " hourly values, got "
			     + std::to_string( fields.size() ) + " fields" );
    }

    const std::string station( trim( fields[ 0 ] ) );
    if ( station.empty() ) {
      throw InputShapeError( "ForecastReader", "line " + std::to_string( _line_number ) + ": missing station code" );
    }

    std::vector< std::pair< int, double > > points;
    for ( int hour = 1; hour <= ForecastSeries::HORIZON; hour++ ) {
      points.push_back( std::make_pair( hour, parse_value( fields[ hour ], _line_number, hour ) ) );
    }

    try {
      out.push_back( StationForecast( station, _pollutant, ForecastSeries( points ) ) );
    } catch ( const InputShapeError & e ) {
      throw InputShapeError( "ForecastReader", "line " + std::to_string( _line_number ) + ": " + e.detail );
    }

    return true;
  }

  return false;
}
