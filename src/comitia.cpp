#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/endian.hpp>
#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <comitia/config.hpp>
#include <comitia/encode.hpp>
#include <comitia/governance/types.hpp>
#include <comitia/host.hpp>
#include <comitia/log.hpp>
#include <comitia/memory.hpp>
#include <comitia/program.hpp>
#include <comitia/protocol.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto help_option       = "help,h"s;
constexpr auto config_option     = "config,c"s;
constexpr auto config_default    = "comitia.yml"s;
constexpr auto record_option     = "record,r"s;
constexpr auto record_default    = "ledger.rec"s;
constexpr auto caller_option     = "caller"s;
constexpr auto time_option       = "time,t"s;
constexpr auto log_level_option  = "log-level,l"s;
constexpr auto log_level_default = "info"s;
constexpr auto action_option     = "action"s;
constexpr auto arguments_option  = "arguments"s;
constexpr auto host_section      = "host"s;

} // namespace constants

using namespace comitia;

namespace {

enum class argument_kind
{
  u8,
  u32,
  u64,
  account
};

enum class output_kind
{
  none,
  u32,
  u64,
  state
};

struct action_layout
{
  std::vector< argument_kind > arguments;
  output_kind output;
};

action_layout layout_of( program::dao::instruction i )
{
  using enum program::dao::instruction;
  using enum argument_kind;

  switch( i )
  {
    case propose:
      return { { u32 }, output_kind::u32 };
    case cast_vote:
      return { { u32, u8 }, output_kind::none };
    case queue:
      return { { u32 }, output_kind::u32 };
    case execute:
    case cancel:
      return { { u32 }, output_kind::none };
    case delegate:
      return { { account }, output_kind::none };
    case self_register:
      return { {}, output_kind::none };
    case set_member:
      return { { account, u64, u8 }, output_kind::none };
    case grant_role:
    case revoke_role:
      return { { account, u8 }, output_kind::none };
    case cast_vote_by_signature:
      return { { u32, u8, account }, output_kind::none };
    case snapshot:
      return { { u32, account }, output_kind::u64 };
    case proposal_state:
      return { { u32 }, output_kind::state };
    case get_votes:
      return { { account }, output_kind::u64 };
  }
  std::unreachable();
}

template< typename T >
void append( std::vector< std::byte >& out, T value )
{
  boost::endian::native_to_little_inplace( value );
  auto bytes = memory::as_bytes( value );
  out.insert( out.end(), bytes.begin(), bytes.end() );
}

template< typename T >
T parse_number( const std::string& text )
{
  auto value = encode::from_decimal< T >( text );
  if( !value )
    throw std::invalid_argument( "'" + text + "' is not a valid number: " + value.error().message() );

  return *value;
}

protocol::account parse_account( const std::string& text )
{
  auto value = protocol::account_from_hex( text );
  if( !value )
    throw std::invalid_argument( "'" + text + "' is not a valid account: " + value.error().message() );

  return *value;
}

std::vector< std::byte >
encode_input( program::dao::instruction i, const action_layout& layout, const std::vector< std::string >& arguments )
{
  // A proposal without a description hash derives one from the ledger time.
  auto expected = layout.arguments.size();
  if( i == program::dao::instruction::propose && arguments.empty() )
    expected = 0;

  if( arguments.size() != expected )
    throw std::invalid_argument( std::string( program::dao::to_string( i ) ) + " expects "
                                 + std::to_string( layout.arguments.size() ) + " argument(s)" );

  std::vector< std::byte > input;
  append( input, std::to_underlying( i ) );

  if( expected == 0 && !layout.arguments.empty() )
    append( input, std::uint32_t( 0 ) );

  for( std::size_t n = 0; n < arguments.size(); ++n )
  {
    switch( layout.arguments[ n ] )
    {
      case argument_kind::u8:
        append( input, parse_number< std::uint8_t >( arguments[ n ] ) );
        break;
      case argument_kind::u32:
        append( input, parse_number< std::uint32_t >( arguments[ n ] ) );
        break;
      case argument_kind::u64:
        append( input, parse_number< std::uint64_t >( arguments[ n ] ) );
        break;
      case argument_kind::account:
        {
          auto account = parse_account( arguments[ n ] );
          input.insert( input.end(), account.begin(), account.end() );
          break;
        }
    }
  }

  return input;
}

template< typename T >
std::optional< T > decode( std::span< const std::byte > output )
{
  if( output.size() < sizeof( T ) )
    return std::nullopt;

  T value{};
  auto bytes = memory::as_writable_bytes( value );
  std::copy_n( output.begin(), sizeof( T ), bytes.begin() );
  boost::endian::little_to_native_inplace( value );
  return value;
}

void print_output( output_kind kind, std::span< const std::byte > output )
{
  switch( kind )
  {
    case output_kind::none:
      break;
    case output_kind::u32:
      if( auto value = decode< std::uint32_t >( output ); value )
        std::cout << *value << '\n';
      break;
    case output_kind::u64:
      if( auto value = decode< std::uint64_t >( output ); value )
        std::cout << *value << '\n';
      break;
    case output_kind::state:
      if( auto value = decode< std::uint8_t >( output );
          value && *value <= std::to_underlying( governance::proposal_state::executed ) )
        std::cout << governance::to_string( static_cast< governance::proposal_state >( *value ) ) << '\n';
      break;
  }
}

// Command line, then the host section of the configuration, then the default.
template< typename T >
T get_option( const std::string& key,
              const T& default_value,
              const boost::program_options::variables_map& args,
              const YAML::Node& section )
{
  auto name = key.substr( 0, key.find( ',' ) );

  if( args.count( name ) )
    return args[ name ].as< T >();

  if( section && section[ name ] )
    return section[ name ].as< T >();

  return default_value;
}

} // namespace

int main( int argc, char** argv )
{
  comitia::log::initialize();

  try
  {
    boost::program_options::options_description options( "Options" );

    // clang-format off
    options.add_options()
      ( constants::help_option.data()     , "Print this help message and exit" )
      ( constants::config_option.data()   , boost::program_options::value< std::string >()->default_value( constants::config_default ), "The YAML configuration file" )
      ( constants::record_option.data()   , boost::program_options::value< std::string >(), "The ledger record file" )
      ( constants::caller_option.data()   , boost::program_options::value< std::string >(), "The calling account as 40 hex characters" )
      ( constants::time_option.data()     , boost::program_options::value< std::uint32_t >(), "The ledger time in seconds (default: wall clock)" )
      ( constants::log_level_option.data(), boost::program_options::value< std::string >(), "The log filtering level" );

    boost::program_options::options_description hidden;
    hidden.add_options()
      ( constants::action_option.data()   , boost::program_options::value< std::string >(), "The governance action" )
      ( constants::arguments_option.data(), boost::program_options::value< std::vector< std::string > >(), "The action arguments" );
    // clang-format on

    boost::program_options::options_description all;
    all.add( options ).add( hidden );

    boost::program_options::positional_options_description positional;
    positional.add( constants::action_option.data(), 1 );
    positional.add( constants::arguments_option.data(), -1 );

    boost::program_options::variables_map args;
    boost::program_options::store(
      boost::program_options::command_line_parser( argc, argv ).options( all ).positional( positional ).run(),
      args );
    boost::program_options::notify( args );

    if( args.count( "help" ) || !args.count( constants::action_option ) )
    {
      std::cout << "Usage: comitia [options] <action> [arguments...]\n" << options << '\n';
      return args.count( "help" ) ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    auto config_path = std::filesystem::path( args[ "config" ].as< std::string >() );

    auto settings = config::load( config_path );
    if( !settings )
    {
      LOG_ERROR( comitia::log::instance(), "Invalid configuration: {}", settings.error().message() );
      return EXIT_FAILURE;
    }

    YAML::Node host_config;
    if( std::filesystem::exists( config_path ) )
    {
      auto document = YAML::LoadFile( config_path.string() );
      if( document.IsMap() )
        host_config = document[ constants::host_section ];
    }

    // clang-format off
    auto log_level   = get_option< std::string >( constants::log_level_option, constants::log_level_default, args, host_config );
    auto record_path = get_option< std::string >( constants::record_option, constants::record_default, args, host_config );
    auto caller_hex  = get_option< std::string >( constants::caller_option, std::string{}, args, host_config );
    // clang-format on

    comitia::log::set_level( log_level );

    std::optional< std::uint32_t > time;
    if( args.count( "time" ) )
      time = args[ "time" ].as< std::uint32_t >();
    else if( host_config && host_config[ "time" ] )
      time = host_config[ "time" ].as< std::uint32_t >();

    if( caller_hex.empty() )
    {
      LOG_ERROR( comitia::log::instance(), "A caller account is required" );
      return EXIT_FAILURE;
    }

    auto action      = args[ constants::action_option ].as< std::string >();
    auto instruction = program::dao::instruction_from_string( action );
    if( !instruction )
    {
      LOG_ERROR( comitia::log::instance(), "Unknown action '{}'", action );
      return EXIT_FAILURE;
    }

    std::vector< std::string > arguments;
    if( args.count( constants::arguments_option ) )
      arguments = args[ constants::arguments_option ].as< std::vector< std::string > >();

    auto layout = layout_of( *instruction );

    host::file_host host( record_path, parse_account( caller_hex ), time );
    host.set_input( encode_input( *instruction, layout, arguments ) );

    program::dao dao( *settings );
    auto ec   = dao.run( &host );
    auto code = program::exit_code( ec );

    if( !ec )
      print_output( layout.output, host.output() );
    else
      LOG_ERROR( comitia::log::instance(), "{} failed: {}", action, ec.message() );

    std::cout << "result: " << code << '\n';
    comitia::log::instance()->flush_log();

    return code == program::success_code ? EXIT_SUCCESS : EXIT_FAILURE;
  }
  catch( const boost::program_options::error& e )
  {
    LOG_ERROR( comitia::log::instance(), "Invalid argument: {}", e.what() );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( comitia::log::instance(), "Invalid configuration: {}", e.what() );
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( comitia::log::instance(), "Error: {}", e.what() );
  }

  comitia::log::instance()->flush_log();
  return EXIT_FAILURE;
}
