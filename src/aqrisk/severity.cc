#include <string>

#include "severity.hh"
#include "riskerror.hh"

using namespace AQRisk;

constexpr double SeverityScale::DEFAULT_MEDIUM_FROM;
constexpr double SeverityScale::DEFAULT_HIGH_ABOVE;

const char * AQRisk::severity_name( const Severity severity )
{
  switch ( severity ) {
  case LOW:    return "low";
  case MEDIUM: return "medium";
  case HIGH:   return "high";
  }
  return "unknown";
}

const char * AQRisk::severity_color( const Severity severity )
{
  switch ( severity ) {
  case LOW:    return "green";
  case MEDIUM: return "yellow";
  case HIGH:   return "red";
  }
  return "unknown";
}

Proto::Severity AQRisk::severity_to_protobuf( const Severity severity )
{
  switch ( severity ) {
  case LOW:    return Proto::SEVERITY_LOW;
  case MEDIUM: return Proto::SEVERITY_MEDIUM;
  case HIGH:   return Proto::SEVERITY_HIGH;
  }
  return Proto::SEVERITY_LOW;
}

SeverityScale::SeverityScale( const double s_medium_from, const double s_high_above )
  : _medium_from( s_medium_from ),
    _high_above( s_high_above )
{
  if ( !( 0.0 <= _medium_from && _medium_from <= _high_above && _high_above <= 1.0 ) ) {
    throw ConfigurationError( "SeverityScale", "cut points must satisfy 0 <= "
			      + std::to_string( _medium_from ) + " <= "
			      + std::to_string( _high_above ) + " <= 1" );
  }
}

SeverityScale::SeverityScale()
  : _medium_from( DEFAULT_MEDIUM_FROM ),
    _high_above( DEFAULT_HIGH_ABOVE )
{}

Severity SeverityScale::bucket( const double probability ) const
{
  if ( probability < _medium_from ) {
    return LOW;
  } else if ( probability > _high_above ) {
    return HIGH;
  } else {
    return MEDIUM;
  }
}
