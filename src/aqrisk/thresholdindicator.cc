#include <assert.h>
#include <cmath>

#include "thresholdindicator.hh"
#include "windowaggregator.hh"
#include "riskerror.hh"

using namespace AQRisk;

Threshold::Threshold( const Proto::ThresholdConfig & stored )
  : value( stored.value() ),
    label( stored.label() ),
    mode( stored.mode() == Proto::MODE_MOVING_AVERAGE_8H ? MOVING_AVERAGE_8H : POINT )
{}

Proto::ThresholdConfig Threshold::to_protobuf( void ) const
{
  Proto::ThresholdConfig ret;
  ret.set_value( value );
  ret.set_label( label );
  ret.set_mode( mode == MOVING_AVERAGE_8H ? Proto::MODE_MOVING_AVERAGE_8H : Proto::MODE_POINT );
  return ret;
}

ThresholdIndicator::ThresholdIndicator( const Threshold & s_threshold, const ErrorModel & s_error_model )
  : _threshold( s_threshold ),
    _error_model( s_error_model )
{
  if ( !std::isfinite( _threshold.value ) ) {
    throw ConfigurationError( "ThresholdIndicator", "threshold \"" + _threshold.label + "\" is not finite" );
  }
}

IndicatorEvaluation ThresholdIndicator::evaluate( const ForecastSeries & series ) const
{
  switch ( _threshold.mode ) {
  case POINT:
    return evaluate_point( series );
  case MOVING_AVERAGE_8H:
    return evaluate_moving_average( series );
  }

  throw ConfigurationError( "ThresholdIndicator::evaluate", "unknown aggregation mode" );
}

IndicatorEvaluation ThresholdIndicator::evaluate_point( const ForecastSeries & series ) const
{
  const int hour = series.peak_hour();
  const double peak = series.at_hour( hour );

  return IndicatorEvaluation( _error_model.exceedance_probability( peak, _threshold.value ), hour, peak );
}

IndicatorEvaluation ThresholdIndicator::evaluate_moving_average( const ForecastSeries & series ) const
{
  const std::vector< WindowProbability > windows( window_probabilities( series ) );
  assert( !windows.empty() );

  /* worst window wins; ties keep the earliest centre */
  auto worst = windows.begin();
  for ( auto it = windows.begin(); it != windows.end(); it++ ) {
    if ( it->probability > worst->probability ) {
      worst = it;
    }
  }

  return IndicatorEvaluation( worst->probability, worst->center_hour, worst->average );
}

std::vector< WindowProbability > ThresholdIndicator::window_probabilities( const ForecastSeries & series ) const
{
  std::vector< WindowProbability > ret;

  const std::vector< WindowAverage > averages( WindowAggregator::moving_average_8h( series ) );
  for ( auto it = averages.begin(); it != averages.end(); it++ ) {
    ret.push_back( WindowProbability( it->center_hour,
				      it->average,
				      _error_model.exceedance_probability( it->average, _threshold.value ) ) );
  }

  return ret;
}
