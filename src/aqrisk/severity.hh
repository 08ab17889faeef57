#ifndef AQRISK_SEVERITY_HH
#define AQRISK_SEVERITY_HH

#include "riskreport.pb.h"

namespace AQRisk {
  enum Severity {
    LOW,
    MEDIUM,
    HIGH
  };

  const char * severity_name( const Severity severity );

  /* gauge colour: green, yellow, red */
  const char * severity_color( const Severity severity );

  Proto::Severity severity_to_protobuf( const Severity severity );

  class SeverityScale
  {
  private:
    double _medium_from;
    double _high_above;

  public:
    static constexpr double DEFAULT_MEDIUM_FROM = 0.20;
    static constexpr double DEFAULT_HIGH_ABOVE = 0.50;

    /* p < medium_from is low, p > high_above is high, medium in between (inclusive) */
    SeverityScale( const double s_medium_from, const double s_high_above );
    SeverityScale();

    Severity bucket( const double probability ) const;

    double medium_from( void ) const { return _medium_from; }
    double high_above( void ) const { return _high_above; }
  };
}

#endif
