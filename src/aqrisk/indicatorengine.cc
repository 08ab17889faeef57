#include "indicatorengine.hh"

using namespace AQRisk;

Proto::IndicatorResult IndicatorResult::to_protobuf( void ) const
{
  Proto::IndicatorResult ret;
  ret.set_label( label );
  ret.set_probability( probability );
  ret.set_severity( severity_to_protobuf( severity ) );
  ret.set_driving_hour( driving_hour );
  ret.set_driving_value( driving_value );
  return ret;
}

IndicatorEngine::IndicatorEngine( const Calibration & calibration )
  : _indicators(),
    _scale( calibration.severity() )
{
  const std::vector< Threshold > & thresholds = calibration.thresholds();
  for ( auto it = thresholds.begin(); it != thresholds.end(); it++ ) {
    _indicators.push_back( ThresholdIndicator( *it, calibration.error_model( it->mode ) ) );
  }
}

std::vector< IndicatorResult > IndicatorEngine::compute_indicators( const ForecastSeries & series ) const
{
  std::vector< IndicatorResult > ret;

  for ( auto it = _indicators.begin(); it != _indicators.end(); it++ ) {
    const IndicatorEvaluation evaluation( it->evaluate( series ) );
    ret.push_back( IndicatorResult( it->threshold().label,
				    evaluation.probability,
				    _scale.bucket( evaluation.probability ),
				    evaluation.driving_hour,
				    evaluation.driving_value ) );
  }

  return ret;
}
