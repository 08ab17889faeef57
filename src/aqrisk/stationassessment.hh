#ifndef AQRISK_STATIONASSESSMENT_HH
#define AQRISK_STATIONASSESSMENT_HH

#include <string>
#include <vector>

#include "calibration.hh"
#include "classification.hh"
#include "forecastseries.hh"
#include "indicatorengine.hh"
#include "pollutant.hh"
#include "riskreport.pb.h"

namespace AQRisk {
  class StationForecast
  {
  public:
    std::string station;
    Pollutant pollutant;
    ForecastSeries series;

    StationForecast( const std::string & s_station, const Pollutant s_pollutant, const ForecastSeries & s_series )
      : station( s_station ), pollutant( s_pollutant ), series( s_series ) {}
  };

  class StationAssessment
  {
  public:
    std::string station;
    Pollutant pollutant;
    double peak_value;
    int peak_hour;
    ClassificationResult classification;     /* of the 24-hour maximum */
    std::vector< IndicatorResult > indicators; /* empty unless the pollutant has them */

    StationAssessment( const std::string & s_station, const Pollutant s_pollutant,
		       const double s_peak_value, const int s_peak_hour,
		       const ClassificationResult & s_classification,
		       const std::vector< IndicatorResult > & s_indicators )
      : station( s_station ), pollutant( s_pollutant ),
	peak_value( s_peak_value ), peak_hour( s_peak_hour ),
	classification( s_classification ), indicators( s_indicators ) {}

    Proto::StationReport to_protobuf( void ) const;
  };

  class StationAssessor
  {
  private:
    Calibration _calibration;
    IndicatorEngine _engine;

  public:
    StationAssessor( const Calibration & s_calibration );

    StationAssessment assess( const StationForecast & forecast ) const;
  };

  /* highest forecast value over every station and hour */
  class NetworkPeak
  {
  public:
    std::string station;
    int hour;
    double value;
    ClassificationResult classification;

    NetworkPeak( const std::string & s_station, const int s_hour, const double s_value,
		 const ClassificationResult & s_classification )
      : station( s_station ), hour( s_hour ), value( s_value ), classification( s_classification ) {}

    Proto::NetworkPeak to_protobuf( void ) const;
  };

  /* ties go to the first station in input order, then the earliest hour.
     throws InputShapeError when empty or when pollutants are mixed */
  NetworkPeak summarize_network_peak( const std::vector< StationForecast > & forecasts,
				      const ClassificationTable & table );
}

#endif
