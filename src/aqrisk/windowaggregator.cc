#include <assert.h>

#include "windowaggregator.hh"

using namespace AQRisk;

const int WindowAggregator::HOURS_BEFORE;
const int WindowAggregator::HOURS_AFTER;
const int WindowAggregator::WIDTH;

std::vector< WindowAverage > WindowAggregator::moving_average_8h( const ForecastSeries & series )
{
  std::vector< WindowAverage > ret;

  for ( int center = first_center(); center <= last_center(); center++ ) {
    double sum = 0.0;
    for ( int hour = center - HOURS_BEFORE; hour <= center + HOURS_AFTER; hour++ ) {
      sum += series.at_hour( hour );
    }
    ret.push_back( WindowAverage( center, sum / WIDTH ) );
  }

  assert( ret.size() == static_cast< size_t >( ForecastSeries::HORIZON - WIDTH + 1 ) );

  return ret;
}
