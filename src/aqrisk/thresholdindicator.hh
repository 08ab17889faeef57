#ifndef AQRISK_THRESHOLDINDICATOR_HH
#define AQRISK_THRESHOLDINDICATOR_HH

#include <string>
#include <vector>

#include "errormodel.hh"
#include "forecastseries.hh"
#include "calibration.pb.h"

namespace AQRisk {
  enum AggregationMode {
    POINT,             /* daily maximum against the threshold */
    MOVING_AVERAGE_8H  /* worst centred 8-hour average against the threshold */
  };

  class Threshold
  {
  public:
    double value;
    std::string label;
    AggregationMode mode;

    Threshold( const double s_value, const std::string & s_label, const AggregationMode s_mode )
      : value( s_value ), label( s_label ), mode( s_mode ) {}
    Threshold( const Proto::ThresholdConfig & stored );

    Proto::ThresholdConfig to_protobuf( void ) const;
  };

  class WindowProbability
  {
  public:
    int center_hour;
    double average;
    double probability;

    WindowProbability( const int s_center_hour, const double s_average, const double s_probability )
      : center_hour( s_center_hour ), average( s_average ), probability( s_probability ) {}
  };

  class IndicatorEvaluation
  {
  public:
    double probability;
    int driving_hour;     /* peak hour, or centre of the worst window */
    double driving_value; /* forecast maximum, or that window's average */

    IndicatorEvaluation( const double s_probability, const int s_driving_hour, const double s_driving_value )
      : probability( s_probability ), driving_hour( s_driving_hour ), driving_value( s_driving_value ) {}
  };

  class ThresholdIndicator
  {
  private:
    Threshold _threshold;
    ErrorModel _error_model;

    IndicatorEvaluation evaluate_point( const ForecastSeries & series ) const;
    IndicatorEvaluation evaluate_moving_average( const ForecastSeries & series ) const;

  public:
    ThresholdIndicator( const Threshold & s_threshold, const ErrorModel & s_error_model );

    IndicatorEvaluation evaluate( const ForecastSeries & series ) const;

    double probability( const ForecastSeries & series ) const { return evaluate( series ).probability; }

    /* exceedance probability of every complete 8-hour window */
    std::vector< WindowProbability > window_probabilities( const ForecastSeries & series ) const;

    const Threshold & threshold( void ) const { return _threshold; }
  };
}

#endif
