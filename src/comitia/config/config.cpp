#include <comitia/config/config.hpp>

#include <cstdint>
#include <limits>
#include <string>

#include <comitia/log.hpp>

namespace comitia::config {

using governance::governance_errc;

constexpr std::size_t minimum_record_capacity = 64;
constexpr std::uint8_t maximum_percentage     = 100;
constexpr std::size_t maximum_index_count     = std::numeric_limits< std::uint8_t >::max();

namespace {

template< typename T >
bool read_key( const YAML::Node& section, const char* key, T& out )
{
  const auto node = section[ key ];
  if( !node )
    return true;

  try
  {
    out = node.as< T >();
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( log::instance(), "Invalid value for {}: {}", key, e.what() );
    return false;
  }

  return true;
}

// yaml-cpp reads an 8-bit integer as a character.
bool read_percentage( const YAML::Node& section, const char* key, std::uint8_t& out )
{
  unsigned int value = out;
  if( !read_key( section, key, value ) )
    return false;

  if( value > maximum_percentage )
  {
    LOG_ERROR( log::instance(), "{} must not exceed {}", key, maximum_percentage );
    return false;
  }

  out = static_cast< std::uint8_t >( value );
  return true;
}

} // namespace

std::error_code validate( const governance::settings& s ) noexcept
{
  if( s.quorum_percentage > maximum_percentage )
    return governance_errc::bad_config;

  for( auto count: { s.max_members, s.max_proposals, s.max_operations } )
  {
    if( count < 1 || count > maximum_index_count )
      return governance_errc::bad_config;
  }

  if( s.voting_period == 0 || s.record_capacity < minimum_record_capacity )
    return governance_errc::bad_config;

  return {};
}

result< governance::settings > parse( const YAML::Node& document )
{
  governance::settings s;

  if( !document || document.IsNull() )
    return s;

  if( !document.IsMap() )
    return std::unexpected( governance_errc::bad_config );

  const auto section = document[ governance_section ];
  if( !section )
    return s;

  if( !section.IsMap() )
    return std::unexpected( governance_errc::bad_config );

  // clang-format off
  bool ok = read_key( section, "voting_delay", s.voting_delay )
         && read_key( section, "voting_period", s.voting_period )
         && read_key( section, "proposal_threshold", s.proposal_threshold )
         && read_percentage( section, "quorum_percentage", s.quorum_percentage )
         && read_key( section, "timelock_min_delay", s.timelock_min_delay )
         && read_key( section, "timelock_grace_period", s.timelock_grace_period )
         && read_key( section, "self_register_initial_power", s.self_register_initial_power )
         && read_key( section, "max_members", s.max_members )
         && read_key( section, "max_proposals", s.max_proposals )
         && read_key( section, "max_operations", s.max_operations )
         && read_key( section, "record_capacity", s.record_capacity );
  // clang-format on

  if( !ok )
    return std::unexpected( governance_errc::bad_config );

  if( auto ec = validate( s ); ec )
    return std::unexpected( ec );

  return s;
}

result< governance::settings > load( const std::filesystem::path& path )
{
  std::error_code ec;
  if( !std::filesystem::exists( path, ec ) )
  {
    LOG_WARNING( log::instance(), "Configuration {} not found, using defaults", path.string() );
    return governance::settings{};
  }

  YAML::Node document;
  try
  {
    document = YAML::LoadFile( path.string() );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( log::instance(), "Unable to parse {}: {}", path.string(), e.what() );
    return std::unexpected( governance_errc::bad_config );
  }

  return parse( document );
}

} // namespace comitia::config
