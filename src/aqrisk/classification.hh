#ifndef AQRISK_CLASSIFICATION_HH
#define AQRISK_CLASSIFICATION_HH

#include <string>
#include <vector>

#include "pollutant.hh"
#include "calibration.pb.h"
#include "riskreport.pb.h"

namespace AQRisk {
  class ClassificationBand
  {
  public:
    std::string category;
    std::string color;
    double min_inclusive;
    bool open;            /* top band: no upper bound */
    double max_inclusive; /* ignored when open */

    /* bounded band */
    ClassificationBand( const std::string & s_category, const std::string & s_color,
			const double s_min_inclusive, const double s_max_inclusive )
      : category( s_category ), color( s_color ),
	min_inclusive( s_min_inclusive ), open( false ), max_inclusive( s_max_inclusive ) {}

    /* open-ended band */
    ClassificationBand( const std::string & s_category, const std::string & s_color,
			const double s_min_inclusive )
      : category( s_category ), color( s_color ),
	min_inclusive( s_min_inclusive ), open( true ), max_inclusive( s_min_inclusive ) {}

    ClassificationBand( const Proto::Band & stored );

    Proto::Band to_protobuf( void ) const;
  };

  class ClassificationResult
  {
  public:
    std::string category;
    std::string color;

    ClassificationResult( const std::string & s_category, const std::string & s_color )
      : category( s_category ), color( s_color ) {}

    Proto::Classification to_protobuf( void ) const;
  };

  /* Ordered bands covering [0, inf). The printed upper bounds are on the
     unit grid of the published tables (Buena 0-57, Aceptable 58-89, ...);
     a value between two printed bands (57.5) belongs to the lower band,
     i.e. each band owns [min_inclusive, next band's min_inclusive). */
  class ClassificationTable
  {
  private:
    std::vector< ClassificationBand > _bands;

    void validate( void ) const;

  public:
    /* throws ConfigurationError for empty, gapped, overlapping or unordered tables */
    ClassificationTable( const std::vector< ClassificationBand > & s_bands );
    ClassificationTable( const Proto::BandTable & stored );

    /* throws OutOfDomainError for negative (or NaN) concentrations */
    ClassificationResult classify( const double concentration ) const;

    const std::vector< ClassificationBand > & bands( void ) const { return _bands; }

    Proto::BandTable to_protobuf( const Pollutant pollutant ) const;

    static ClassificationTable ozone( void );
    static ClassificationTable pm10( void );
    static ClassificationTable pm25( void );
    static ClassificationTable for_pollutant( const Pollutant pollutant );
  };

  ClassificationResult classify( const double concentration, const ClassificationTable & table );
}

#endif
