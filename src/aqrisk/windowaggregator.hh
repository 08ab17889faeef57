#ifndef AQRISK_WINDOWAGGREGATOR_HH
#define AQRISK_WINDOWAGGREGATOR_HH

#include <vector>

#include "forecastseries.hh"

namespace AQRisk {
  class WindowAverage
  {
  public:
    int center_hour;
    double average;

    WindowAverage( const int s_center_hour, const double s_average )
      : center_hour( s_center_hour ), average( s_average ) {}
  };

  /* Centred 8-hour moving average. The window for centre t covers hours
     t-3 .. t+4. Centres whose window would leave the series are dropped,
     never clipped or padded, so a 24-hour series yields centres 4..20. */
  class WindowAggregator
  {
  public:
    static const int HOURS_BEFORE = 3;
    static const int HOURS_AFTER = 4;
    static const int WIDTH = HOURS_BEFORE + 1 + HOURS_AFTER;

    static std::vector< WindowAverage > moving_average_8h( const ForecastSeries & series );

    static int first_center( void ) { return 1 + HOURS_BEFORE; }
    static int last_center( void ) { return ForecastSeries::HORIZON - HOURS_AFTER; }
  };
}

#endif
