#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <google/protobuf/text_format.h>

#include "calibration.hh"
#include "forecastreader.hh"
#include "riskerror.hh"
#include "stationassessment.hh"
#include "riskreport.pb.h"

using namespace AQRisk;

static void usage( const char *argv0 )
{
  fprintf( stderr, "Usage: %s [--pollutant O3|PM10|PM2.5] [FORECAST.csv]\n", argv0 );
  fprintf( stderr, "  AQRISK_CALIBRATION_IN   calibration in protobuf text format\n" );
  fprintf( stderr, "  AQRISK_CALIBRATION_OUT  write the calibration in use\n" );
  fprintf( stderr, "  AQRISK_REPORT_OUT       write the binary RiskReport\n" );
}

static Calibration load_calibration( void )
{
  char *filename_in = getenv( "AQRISK_CALIBRATION_IN" );
  if ( filename_in ) {
    fprintf( stderr, "Reading calibration from %s...", filename_in );
    Calibration calibration( Calibration::load( filename_in ) );
    fprintf( stderr, " done.\n" );
    return calibration;
  }

  return Calibration::defaults();
}

static void write_calibration( const Calibration & calibration )
{
  char *filename_out = getenv( "AQRISK_CALIBRATION_OUT" );
  if ( !filename_out ) {
    return;
  }

  std::string text;
  if ( !google::protobuf::TextFormat::PrintToString( calibration.to_protobuf(), &text ) ) {
    fprintf( stderr, "Could not format calibration.\n" );
    exit( 1 );
  }

  FILE *f = fopen( filename_out, "w" );
  if ( f == NULL ) {
    fprintf( stderr, "Could not open %s.\n", filename_out );
    perror( "fopen" );
    exit( 1 );
  }

  fprintf( stderr, "Writing calibration to %s...", filename_out );

  if ( fputs( text.c_str(), f ) < 0 ) {
    perror( "fputs" );
    exit( 1 );
  }

  if ( fclose( f ) != 0 ) {
    perror( "fclose" );
    exit( 1 );
  }

  fprintf( stderr, " done.\n" );
}

static void write_report( const Proto::RiskReport & report )
{
  char *filename_out = getenv( "AQRISK_REPORT_OUT" );
  if ( !filename_out ) {
    return;
  }

  int fd = open( filename_out, O_WRONLY | O_TRUNC | O_CREAT, S_IRUSR | S_IWUSR );
  if ( fd < 0 ) {
    fprintf( stderr, "Could not open %s.\n", filename_out );
    perror( "open" );
    exit( 1 );
  }

  fprintf( stderr, "Writing report to %s...", filename_out );

  if ( !report.SerializeToFileDescriptor( fd ) ) {
    fprintf( stderr, "Could not serialize report.\n" );
    exit( 1 );
  }

  if ( close( fd ) < 0 ) {
    perror( "close" );
    exit( 1 );
  }

  fprintf( stderr, " done.\n" );
}

static void print_assessment( const StationAssessment & assessment )
{
  printf( "%-6s peak %7.1f %s at hour %2d  %s (%s)\n",
	  assessment.station.c_str(),
	  assessment.peak_value,
	  pollutant_units( assessment.pollutant ),
	  assessment.peak_hour,
	  assessment.classification.category.c_str(),
	  assessment.classification.color.c_str() );

  for ( auto it = assessment.indicators.begin(); it != assessment.indicators.end(); it++ ) {
    printf( "       %-32s %5.1f%%  %-6s (%s)\n",
	    it->label.c_str(),
	    100.0 * it->probability,
	    severity_name( it->severity ),
	    severity_color( it->severity ) );
  }
}

int main( int argc, char *argv[] )
{
  Pollutant pollutant = OZONE;
  const char *filename = NULL;

  for ( int i = 1; i < argc; i++ ) {
    if ( strcmp( argv[ i ], "--pollutant" ) == 0 && i + 1 < argc ) {
      if ( !parse_pollutant( argv[ ++i ], pollutant ) ) {
	fprintf( stderr, "Unknown pollutant %s.\n", argv[ i ] );
	usage( argv[ 0 ] );
	return 1;
      }
    } else if ( strcmp( argv[ i ], "--help" ) == 0 || argv[ i ][ 0 ] == '-' || filename ) {
      usage( argv[ 0 ] );
      return 1;
    } else {
      filename = argv[ i ];
    }
  }

  try {
    const Calibration calibration( load_calibration() );
    write_calibration( calibration );

    std::ifstream file;
    std::istream *in = &std::cin;
    if ( filename ) {
      file.open( filename );
      if ( !file ) {
	fprintf( stderr, "Could not open %s.\n", filename );
	return 1;
      }
      in = &file;
    }

    ForecastReader reader( *in, pollutant );
    std::vector< StationForecast > forecasts;
    int skipped = 0;

    while ( 1 ) {
      try {
	if ( !reader.next( forecasts ) ) {
	  break;
	}
      } catch ( const InputShapeError & e ) {
	fprintf( stderr, "Skipping %s\n", e.what().c_str() );
	skipped++;
      }
    }

    fprintf( stderr, "Read %d %s forecasts (%d skipped).\n",
	     (int)forecasts.size(), pollutant_name( pollutant ), skipped );

    const StationAssessor assessor( calibration );
    Proto::RiskReport report;
    report.set_pollutant( pollutant_name( pollutant ) );

    for ( auto it = forecasts.begin(); it != forecasts.end(); it++ ) {
      try {
	const StationAssessment assessment( assessor.assess( *it ) );
	print_assessment( assessment );
	*report.add_stations() = assessment.to_protobuf();
      } catch ( const OutOfDomainError & e ) {
	fprintf( stderr, "Skipping station %s: %s\n", it->station.c_str(), e.what().c_str() );
      }
    }

    if ( !forecasts.empty() ) {
      try {
	const NetworkPeak peak( summarize_network_peak( forecasts, calibration.band_table( pollutant ) ) );
	printf( "Network peak: %.1f %s at %s, hour %d  %s (%s)\n",
		peak.value, pollutant_units( pollutant ), peak.station.c_str(), peak.hour,
		peak.classification.category.c_str(), peak.classification.color.c_str() );
	*report.mutable_network_peak() = peak.to_protobuf();
      } catch ( const OutOfDomainError & e ) {
	fprintf( stderr, "No network peak: %s\n", e.what().c_str() );
      }
    }

    write_report( report );
  } catch ( const ConfigurationError & e ) {
    fprintf( stderr, "Configuration error: %s\n", e.what().c_str() );
    return 1;
  }

  return 0;
}
