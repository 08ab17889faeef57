#include <cmath>
#include <string>

#include "errormodel.hh"
#include "riskerror.hh"

using namespace AQRisk;

Proto::ErrorModelParams ErrorModelParams::to_protobuf( void ) const
{
  Proto::ErrorModelParams ret;
  ret.set_mu( mu );
  ret.set_sigma( sigma );
  return ret;
}

ErrorModel::ErrorModel( const ErrorModelParams & s_params )
  : _params( s_params ),
    _standard( 0, 1 )
{
  if ( !std::isfinite( _params.mu ) ) {
    throw ConfigurationError( "ErrorModel", "mu must be finite" );
  }

  if ( !( _params.sigma > 0 ) || !std::isfinite( _params.sigma ) ) {
    throw ConfigurationError( "ErrorModel", "sigma must be positive and finite, got "
			      + std::to_string( _params.sigma ) );
  }
}

double ErrorModel::exceedance_probability( const double predicted, const double threshold ) const
{
  if ( std::isnan( predicted ) || std::isnan( threshold ) ) {
    throw OutOfDomainError( "ErrorModel::exceedance_probability", "NaN forecast or threshold" );
  }

  const double z = ( threshold - predicted - _params.mu ) / _params.sigma;

  /* upper tail */
  double ret = boost::math::cdf( boost::math::complement( _standard, z ) );

  if ( ret < 0.0 ) {
    ret = 0.0;
  } else if ( ret > 1.0 ) {
    ret = 1.0;
  }

  return ret;
}
