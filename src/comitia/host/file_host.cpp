#include <comitia/host/file_host.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <utility>

#include <comitia/log.hpp>

namespace comitia::host {

file_host::file_host( std::filesystem::path record_path,
                      const protocol::account& caller,
                      std::optional< std::uint32_t > time ):
    _record_path( std::move( record_path ) ),
    _caller( caller ),
    _time( time )
{}

std::error_code file_host::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  switch( fd )
  {
    case program::file_descriptor::stdout:
      _output.insert( _output.end(), buffer.begin(), buffer.end() );
      return {};
    case program::file_descriptor::stderr:
      LOG_WARNING( log::instance(),
                   "{}",
                   std::string_view( reinterpret_cast< const char* >( buffer.data() ), // NOLINT
                                     buffer.size() ) );
      return {};
    case program::file_descriptor::stdin:
      break;
  }

  return std::make_error_code( std::errc::bad_file_descriptor );
}

std::error_code file_host::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != program::file_descriptor::stdin )
    return std::make_error_code( std::errc::bad_file_descriptor );

  if( _input.size() - _input_position < buffer.size() )
    return std::make_error_code( std::errc::no_message_available );

  std::copy_n( _input.begin() + static_cast< std::ptrdiff_t >( _input_position ), buffer.size(), buffer.begin() );
  _input_position += buffer.size();
  return {};
}

program::result< std::string > file_host::read_record()
{
  std::error_code ec;
  if( !std::filesystem::exists( _record_path, ec ) )
  {
    if( ec )
    {
      LOG_ERROR( log::instance(), "Unable to access {}: {}", _record_path.string(), ec.message() );
      return std::unexpected( ec );
    }

    LOG_DEBUG( log::instance(), "Record {} does not exist, starting empty", _record_path.string() );
    return std::string{};
  }

  std::ifstream file( _record_path, std::ios::binary );
  if( !file )
  {
    LOG_ERROR( log::instance(), "Unable to open {}", _record_path.string() );
    return std::unexpected( std::make_error_code( std::errc::io_error ) );
  }

  std::string data( ( std::istreambuf_iterator< char >( file ) ), std::istreambuf_iterator< char >() );
  if( file.bad() )
  {
    LOG_ERROR( log::instance(), "Unable to read {}", _record_path.string() );
    return std::unexpected( std::make_error_code( std::errc::io_error ) );
  }

  return data;
}

std::error_code file_host::write_record( std::string_view bytes )
{
  auto temporary = _record_path;
  temporary += ".tmp";

  {
    std::ofstream file( temporary, std::ios::binary | std::ios::trunc );
    if( !file )
    {
      LOG_ERROR( log::instance(), "Unable to open {}", temporary.string() );
      return std::make_error_code( std::errc::io_error );
    }

    file.write( bytes.data(), static_cast< std::streamsize >( bytes.size() ) );
    file.flush();
    if( !file )
    {
      LOG_ERROR( log::instance(), "Unable to write {}", temporary.string() );
      return std::make_error_code( std::errc::io_error );
    }
  }

  std::error_code ec;
  std::filesystem::rename( temporary, _record_path, ec );
  if( ec )
  {
    LOG_ERROR( log::instance(), "Unable to replace {}: {}", _record_path.string(), ec.message() );
    std::filesystem::remove( temporary, ec );
    return std::make_error_code( std::errc::io_error );
  }

  return {};
}

program::result< protocol::account > file_host::get_caller()
{
  return _caller;
}

std::uint32_t file_host::get_time()
{
  if( _time )
    return *_time;

  auto seconds =
    std::chrono::duration_cast< std::chrono::seconds >( std::chrono::system_clock::now().time_since_epoch() ).count();
  return static_cast< std::uint32_t >( seconds );
}

std::error_code file_host::notify_execution( std::uint32_t proposal_id, std::uint32_t operation_id )
{
  LOG_INFO( log::instance(), "Executed proposal {} through operation {}", proposal_id, operation_id );
  return {};
}

void file_host::set_input( std::vector< std::byte > input )
{
  _input          = std::move( input );
  _input_position = 0;
}

std::span< const std::byte > file_host::output() const noexcept
{
  return _output;
}

} // namespace comitia::host
