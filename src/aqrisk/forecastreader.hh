#ifndef AQRISK_FORECASTREADER_HH
#define AQRISK_FORECASTREADER_HH

#include <istream>
#include <string>
#include <vector>

#include "pollutant.hh"
#include "stationassessment.hh"

namespace AQRisk {
  /* One station per line: STATION,h1,...,h24. Blank lines and a header
     line starting with "station" are skipped. */
  class ForecastReader
  {
  private:
    std::istream & _in;
    const Pollutant _pollutant;
    unsigned int _line_number;

    static double parse_value( const std::string & field, const unsigned int line_number, const int hour );

  public:
    ForecastReader( std::istream & s_in, const Pollutant s_pollutant );

    /* Appends the next station forecast to out; false at end of input.
       A malformed line throws InputShapeError and is consumed, so the
       caller may report it and keep reading. */
    bool next( std::vector< StationForecast > & out );

    unsigned int line_number( void ) const { return _line_number; }
  };
}

#endif
