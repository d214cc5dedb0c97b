// NOLINTBEGIN

#include <test/fixture.hpp>

#include <boost/filesystem.hpp>

#include <comitia/log.hpp>

namespace test {

comitia::protocol::account make_test_account( std::uint8_t id )
{
  comitia::protocol::account acc{};
  acc[ 0 ] = std::byte{ id };
  return acc;
}

std::error_code host::write( comitia::program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd != comitia::program::file_descriptor::stdout )
    return std::make_error_code( std::errc::bad_file_descriptor );

  stdout_bytes.insert( stdout_bytes.end(), buffer.begin(), buffer.end() );
  return {};
}

std::error_code host::read( comitia::program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != comitia::program::file_descriptor::stdin )
    return std::make_error_code( std::errc::bad_file_descriptor );

  if( _stdin.size() - _stdin_position < buffer.size() )
    return std::make_error_code( std::errc::no_message_available );

  std::copy_n( _stdin.begin() + static_cast< std::ptrdiff_t >( _stdin_position ), buffer.size(), buffer.begin() );
  _stdin_position += buffer.size();
  return {};
}

comitia::program::result< std::string > host::read_record()
{
  return record;
}

std::error_code host::write_record( std::string_view bytes )
{
  if( fail_record_write )
    return std::make_error_code( std::errc::io_error );

  record = std::string( bytes );
  ++record_writes;
  return {};
}

comitia::program::result< comitia::protocol::account > host::get_caller()
{
  if( !caller_sequence.empty() )
  {
    auto next = caller_sequence.front();
    caller_sequence.pop_front();
    return next;
  }

  return caller;
}

std::uint32_t host::get_time()
{
  return time;
}

std::error_code host::notify_execution( std::uint32_t proposal_id, std::uint32_t operation_id )
{
  executions.emplace_back( proposal_id, operation_id );

  if( on_execution )
    return on_execution( proposal_id, operation_id );

  return {};
}

void host::set_input( std::vector< std::byte > input )
{
  _stdin          = std::move( input );
  _stdin_position = 0;
}

fixture::fixture( const std::string& name, const std::string& log_level )
{
  comitia::log::initialize();
  comitia::log::set_level( log_level );

  _state_dir = std::filesystem::temp_directory_path() / boost::filesystem::unique_path().string();
  LOG_INFO( comitia::log::instance(), "Running {} in temporary directory: {}", name, _state_dir.string() );
  std::filesystem::create_directory( _state_dir );
}

fixture::~fixture()
{
  std::filesystem::remove_all( _state_dir );
}

comitia::record::record fixture::ledger( const host& h ) const
{
  auto r = comitia::record::record::parse( h.record, _settings.record_capacity );
  if( !r )
  {
    ADD_FAILURE() << "host holds an unparsable record: " << r.error().message();
    return comitia::record::record( _settings.record_capacity );
  }

  return *r;
}

} // namespace test

// NOLINTEND
