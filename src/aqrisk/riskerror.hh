#ifndef AQRISK_RISKERROR_HH
#define AQRISK_RISKERROR_HH

#include <string>

namespace AQRisk {
  class RiskException {
  public:
    std::string function;
    std::string detail;

    RiskException( const std::string & s_function, const std::string & s_detail )
      : function( s_function ), detail( s_detail ) {}
    virtual ~RiskException() {}

    std::string what( void ) const { return function + ": " + detail; }
  };

  /* calibration constants or band tables are unusable; fatal at startup */
  class ConfigurationError : public RiskException {
  public:
    ConfigurationError( const std::string & s_function, const std::string & s_detail )
      : RiskException( s_function, s_detail ) {}
  };

  /* forecast series is not 24 consecutive hourly points */
  class InputShapeError : public RiskException {
  public:
    InputShapeError( const std::string & s_function, const std::string & s_detail )
      : RiskException( s_function, s_detail ) {}
  };

  class OutOfDomainError : public RiskException {
  public:
    OutOfDomainError( const std::string & s_function, const std::string & s_detail )
      : RiskException( s_function, s_detail ) {}
  };
}

#endif
