#ifndef AQRISK_ERRORMODEL_HH
#define AQRISK_ERRORMODEL_HH

#include <boost/math/distributions/normal.hpp>

#include "calibration.pb.h"

namespace AQRisk {
  /* mean and standard deviation of (observed - forecast), fit on validation residuals */
  class ErrorModelParams
  {
  public:
    double mu;
    double sigma;

    ErrorModelParams( const double s_mu, const double s_sigma ) : mu( s_mu ), sigma( s_sigma ) {}
    ErrorModelParams( const Proto::ErrorModelParams & stored ) : mu( stored.mu() ), sigma( stored.sigma() ) {}

    Proto::ErrorModelParams to_protobuf( void ) const;
  };

  class ErrorModel
  {
  private:
    ErrorModelParams _params;
    boost::math::normal _standard;

  public:
    /* throws ConfigurationError unless sigma > 0 */
    ErrorModel( const ErrorModelParams & s_params );

    /* P( observed > threshold ) given the forecast, clamped to [0, 1] */
    double exceedance_probability( const double predicted, const double threshold ) const;

    const ErrorModelParams & params( void ) const { return _params; }
  };
}

#endif
