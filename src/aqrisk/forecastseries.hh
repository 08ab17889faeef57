#ifndef AQRISK_FORECASTSERIES_HH
#define AQRISK_FORECASTSERIES_HH

#include <vector>
#include <utility>

namespace AQRisk {
  /* hourly forecast for hours 1..24 ahead of the issue time */
  class ForecastSeries
  {
  public:
    static const int HORIZON = 24;

  private:
    std::vector< double > _values; /* _values[ 0 ] is hour 1 */

    void check_values( void ) const;

  public:
    /* (hour_offset, predicted_value) pairs; offsets must run 1..24 without gaps */
    ForecastSeries( const std::vector< std::pair< int, double > > & points );

    /* values for hours 1..24 in order */
    explicit ForecastSeries( const std::vector< double > & hourly_values );

    int size( void ) const { return _values.size(); }

    double at_hour( const int hour ) const;

    double maximum( void ) const;

    /* earliest hour holding the maximum */
    int peak_hour( void ) const;

    const std::vector< double > & values( void ) const { return _values; }
  };
}

#endif
