#include <cmath>

#include "classification.hh"
#include "riskerror.hh"

using namespace AQRisk;

static const char * CATEGORY_NAMES[] = { "Buena", "Aceptable", "Mala", "Muy Mala", "Extremadamente Mala" };
static const char * CATEGORY_COLORS[] = { "green", "yellow", "orange", "red", "purple" };
static const int CATEGORY_COUNT = 5;

/* five-category table from the lower bound of each category */
static ClassificationTable standard_table( const double lower_bounds[] )
{
  std::vector< ClassificationBand > bands;

  for ( int i = 0; i < CATEGORY_COUNT - 1; i++ ) {
    bands.push_back( ClassificationBand( CATEGORY_NAMES[ i ], CATEGORY_COLORS[ i ],
					 lower_bounds[ i ], lower_bounds[ i + 1 ] - 1 ) );
  }
  bands.push_back( ClassificationBand( CATEGORY_NAMES[ CATEGORY_COUNT - 1 ],
				       CATEGORY_COLORS[ CATEGORY_COUNT - 1 ],
				       lower_bounds[ CATEGORY_COUNT - 1 ] ) );

  return ClassificationTable( bands );
}

ClassificationBand::ClassificationBand( const Proto::Band & stored )
  : category( stored.category() ),
    color( stored.color() ),
    min_inclusive( stored.min_inclusive() ),
    open( !stored.has_max_inclusive() ),
    max_inclusive( stored.has_max_inclusive() ? stored.max_inclusive() : stored.min_inclusive() )
{}

Proto::Band ClassificationBand::to_protobuf( void ) const
{
  Proto::Band ret;
  ret.set_category( category );
  ret.set_color( color );
  ret.set_min_inclusive( min_inclusive );
  if ( !open ) {
    ret.set_max_inclusive( max_inclusive );
  }
  return ret;
}

Proto::Classification ClassificationResult::to_protobuf( void ) const
{
  Proto::Classification ret;
  ret.set_category( category );
  ret.set_color( color );
  return ret;
}

ClassificationTable::ClassificationTable( const std::vector< ClassificationBand > & s_bands )
  : _bands( s_bands )
{
  validate();
}

ClassificationTable::ClassificationTable( const Proto::BandTable & stored )
  : _bands()
{
  for ( int i = 0; i < stored.bands_size(); i++ ) {
    _bands.push_back( ClassificationBand( stored.bands( i ) ) );
  }

  validate();
}

void ClassificationTable::validate( void ) const
{
  if ( _bands.empty() ) {
    throw ConfigurationError( "ClassificationTable", "no bands" );
  }

  if ( _bands.front().min_inclusive != 0.0 ) {
    throw ConfigurationError( "ClassificationTable", "first band \"" + _bands.front().category
			      + "\" must start at 0" );
  }

  for ( unsigned int i = 0; i < _bands.size(); i++ ) {
    const ClassificationBand & band = _bands[ i ];
    const bool top = ( i + 1 == _bands.size() );

    if ( band.category.empty() || band.color.empty() ) {
      throw ConfigurationError( "ClassificationTable", "band " + std::to_string( i )
				+ " needs a category and a color" );
    }

    if ( !std::isfinite( band.min_inclusive ) ) {
      throw ConfigurationError( "ClassificationTable", "band \"" + band.category + "\" has a non-finite bound" );
    }

    if ( top ) {
      if ( !band.open ) {
	throw ConfigurationError( "ClassificationTable", "top band \"" + band.category + "\" must be open-ended" );
      }
      continue;
    }

    const ClassificationBand & next = _bands[ i + 1 ];

    if ( band.open ) {
      throw ConfigurationError( "ClassificationTable", "only the top band may be open-ended, not \""
				+ band.category + "\"" );
    }

    if ( !std::isfinite( band.max_inclusive ) || band.max_inclusive < band.min_inclusive ) {
      throw ConfigurationError( "ClassificationTable", "band \"" + band.category + "\" has an empty range" );
    }

    if ( next.min_inclusive <= band.max_inclusive ) {
      throw ConfigurationError( "ClassificationTable", "bands \"" + band.category + "\" and \""
				+ next.category + "\" overlap" );
    }

    /* printed bounds step on the unit grid; anything wider leaves values unassigned */
    if ( next.min_inclusive - band.max_inclusive > 1.0 ) {
      throw ConfigurationError( "ClassificationTable", "gap between bands \"" + band.category + "\" and \""
				+ next.category + "\"" );
    }
  }
}

ClassificationResult ClassificationTable::classify( const double concentration ) const
{
  if ( std::isnan( concentration ) || concentration < 0.0 ) {
    throw OutOfDomainError( "ClassificationTable::classify", "concentration "
			    + std::to_string( concentration ) + " is outside [0, inf)" );
  }

  for ( unsigned int i = 0; i + 1 < _bands.size(); i++ ) {
    if ( concentration < _bands[ i + 1 ].min_inclusive ) {
      return ClassificationResult( _bands[ i ].category, _bands[ i ].color );
    }
  }

  return ClassificationResult( _bands.back().category, _bands.back().color );
}

Proto::BandTable ClassificationTable::to_protobuf( const Pollutant pollutant ) const
{
  Proto::BandTable ret;
  ret.set_pollutant( pollutant_name( pollutant ) );
  for ( auto it = _bands.begin(); it != _bands.end(); it++ ) {
    *ret.add_bands() = it->to_protobuf();
  }
  return ret;
}

ClassificationTable ClassificationTable::ozone( void )
{
  /* ppb */
  static const double lower_bounds[] = { 0, 58, 90, 135, 175 };
  return standard_table( lower_bounds );
}

ClassificationTable ClassificationTable::pm10( void )
{
  /* ug/m3, NOM from January 2024 */
  static const double lower_bounds[] = { 0, 45, 60, 132, 213 };
  return standard_table( lower_bounds );
}

ClassificationTable ClassificationTable::pm25( void )
{
  /* ug/m3, NOM from January 2024 */
  static const double lower_bounds[] = { 0, 15, 33, 79, 130 };
  return standard_table( lower_bounds );
}

ClassificationTable ClassificationTable::for_pollutant( const Pollutant pollutant )
{
  switch ( pollutant ) {
  case OZONE: return ozone();
  case PM10:  return pm10();
  case PM25:  return pm25();
  }

  throw ConfigurationError( "ClassificationTable::for_pollutant", "unknown pollutant" );
}

ClassificationResult AQRisk::classify( const double concentration, const ClassificationTable & table )
{
  return table.classify( concentration );
}
