#include "pollutant.hh"

using namespace AQRisk;

const char * AQRisk::pollutant_name( const Pollutant pollutant )
{
  switch ( pollutant ) {
  case OZONE: return "O3";
  case PM10:  return "PM10";
  case PM25:  return "PM2.5";
  }
  return "unknown";
}

const char * AQRisk::pollutant_units( const Pollutant pollutant )
{
  switch ( pollutant ) {
  case OZONE: return "ppb";
  case PM10:
  case PM25:  return "ug/m3";
  }
  return "";
}

bool AQRisk::has_indicator_set( const Pollutant pollutant )
{
  return pollutant == OZONE;
}

bool AQRisk::parse_pollutant( const std::string & name, Pollutant & pollutant )
{
  if ( name == "O3" ) {
    pollutant = OZONE;
  } else if ( name == "PM10" ) {
    pollutant = PM10;
  } else if ( name == "PM2.5" || name == "PM25" ) {
    pollutant = PM25;
  } else {
    return false;
  }

  return true;
}
