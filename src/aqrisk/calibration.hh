#ifndef AQRISK_CALIBRATION_HH
#define AQRISK_CALIBRATION_HH

#include <map>
#include <string>
#include <vector>

#include "errormodel.hh"
#include "thresholdindicator.hh"
#include "severity.hh"
#include "classification.hh"
#include "pollutant.hh"
#include "calibration.pb.h"

namespace AQRisk {
  /* Read-only configuration of the indicator and classification engines.
     Every field absent from the stored message takes the operational
     default (ozone error models fit on the 24-hour validation residuals,
     the 50/90/120/150 ppb thresholds, the official band tables). */
  class Calibration
  {
  private:
    ErrorModel _point_error;
    ErrorModel _moving_average_error;
    std::vector< Threshold > _thresholds;
    SeverityScale _severity;
    std::map< Pollutant, ClassificationTable > _band_tables;

  public:
    /* throws ConfigurationError */
    Calibration( const Proto::Calibration & stored );

    static Calibration defaults( void );
    static Calibration from_text( const std::string & text );

    /* protobuf text format */
    static Calibration load( const std::string & filename );

    static ErrorModelParams default_point_error( void ) { return ErrorModelParams( 5.08, 18.03 ); }
    static ErrorModelParams default_moving_average_error( void ) { return ErrorModelParams( -0.43, 6.11 ); }
    static std::vector< Threshold > default_thresholds( void );

    const ErrorModel & error_model( const AggregationMode mode ) const;
    const std::vector< Threshold > & thresholds( void ) const { return _thresholds; }
    const SeverityScale & severity( void ) const { return _severity; }
    const ClassificationTable & band_table( const Pollutant pollutant ) const;

    Proto::Calibration to_protobuf( void ) const;
  };
}

#endif
