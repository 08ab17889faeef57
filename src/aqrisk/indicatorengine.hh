#ifndef AQRISK_INDICATORENGINE_HH
#define AQRISK_INDICATORENGINE_HH

#include <string>
#include <vector>

#include "calibration.hh"
#include "forecastseries.hh"
#include "severity.hh"
#include "thresholdindicator.hh"
#include "riskreport.pb.h"

namespace AQRisk {
  class IndicatorResult
  {
  public:
    std::string label;
    double probability;
    Severity severity;
    int driving_hour;
    double driving_value;

    IndicatorResult( const std::string & s_label, const double s_probability, const Severity s_severity,
		     const int s_driving_hour, const double s_driving_value )
      : label( s_label ), probability( s_probability ), severity( s_severity ),
	driving_hour( s_driving_hour ), driving_value( s_driving_value ) {}

    Proto::IndicatorResult to_protobuf( void ) const;
  };

  class IndicatorEngine
  {
  private:
    std::vector< ThresholdIndicator > _indicators;
    SeverityScale _scale;

  public:
    IndicatorEngine( const Calibration & calibration );

    /* one result per configured threshold, in configuration order
       (by default: 8-hour 50 ppb, then point 90, 120, 150 ppb) */
    std::vector< IndicatorResult > compute_indicators( const ForecastSeries & series ) const;

    const std::vector< ThresholdIndicator > & indicators( void ) const { return _indicators; }
  };
}

#endif
