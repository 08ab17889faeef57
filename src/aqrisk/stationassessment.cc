#include "stationassessment.hh"
#include "riskerror.hh"

using namespace AQRisk;

Proto::StationReport StationAssessment::to_protobuf( void ) const
{
  Proto::StationReport ret;
  ret.set_station( station );
  ret.set_pollutant( pollutant_name( pollutant ) );
  ret.set_peak_value( peak_value );
  ret.set_peak_hour( peak_hour );
  *ret.mutable_classification() = classification.to_protobuf();
  for ( auto it = indicators.begin(); it != indicators.end(); it++ ) {
    *ret.add_indicators() = it->to_protobuf();
  }
  return ret;
}

StationAssessor::StationAssessor( const Calibration & s_calibration )
  : _calibration( s_calibration ),
    _engine( _calibration )
{}

StationAssessment StationAssessor::assess( const StationForecast & forecast ) const
{
  const int peak_hour = forecast.series.peak_hour();
  const double peak_value = forecast.series.at_hour( peak_hour );

  const ClassificationResult classification( _calibration.band_table( forecast.pollutant ).classify( peak_value ) );

  std::vector< IndicatorResult > indicators;
  if ( has_indicator_set( forecast.pollutant ) ) {
    indicators = _engine.compute_indicators( forecast.series );
  }

  return StationAssessment( forecast.station, forecast.pollutant, peak_value, peak_hour,
			    classification, indicators );
}

Proto::NetworkPeak NetworkPeak::to_protobuf( void ) const
{
  Proto::NetworkPeak ret;
  ret.set_station( station );
  ret.set_hour( hour );
  ret.set_value( value );
  *ret.mutable_classification() = classification.to_protobuf();
  return ret;
}

NetworkPeak AQRisk::summarize_network_peak( const std::vector< StationForecast > & forecasts,
					    const ClassificationTable & table )
{
  if ( forecasts.empty() ) {
    throw InputShapeError( "summarize_network_peak", "no station forecasts" );
  }

  auto best = forecasts.begin();
  for ( auto it = forecasts.begin(); it != forecasts.end(); it++ ) {
    if ( it->pollutant != forecasts.front().pollutant ) {
      throw InputShapeError( "summarize_network_peak", "station " + it->station + " forecasts "
			     + pollutant_name( it->pollutant ) + ", expected "
			     + pollutant_name( forecasts.front().pollutant ) );
    }

    if ( it->series.maximum() > best->series.maximum() ) {
      best = it;
    }
  }

  const int hour = best->series.peak_hour();
  const double value = best->series.at_hour( hour );

  return NetworkPeak( best->station, hour, value, table.classify( value ) );
}
