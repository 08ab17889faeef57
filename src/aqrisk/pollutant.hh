#ifndef AQRISK_POLLUTANT_HH
#define AQRISK_POLLUTANT_HH

#include <string>

namespace AQRisk {
  enum Pollutant {
    OZONE,
    PM10,
    PM25
  };

  const char * pollutant_name( const Pollutant pollutant );
  const char * pollutant_units( const Pollutant pollutant );

  /* only ozone carries the exceedance-probability indicators */
  bool has_indicator_set( const Pollutant pollutant );

  /* accepts "O3", "PM10", "PM2.5" (and "PM25"); false if unknown */
  bool parse_pollutant( const std::string & name, Pollutant & pollutant );
}

#endif
