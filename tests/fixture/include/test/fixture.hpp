#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/endian.hpp>
#include <gtest/gtest.h>

#include <comitia/governance/settings.hpp>
#include <comitia/memory.hpp>
#include <comitia/program.hpp>
#include <comitia/protocol.hpp>
#include <comitia/record.hpp>

namespace test {

comitia::protocol::account make_test_account( std::uint8_t id );

/**
 * In-memory host. The record, the clock and the reported caller are plain
 * members so a test can arrange them between runs.
 */
class host final: public comitia::program::system_interface
{
public:
  using execution_callback = std::function< std::error_code( std::uint32_t, std::uint32_t ) >;

  host()                         = default;
  host( const host& )            = delete;
  host( host&& )                 = delete;
  ~host() override               = default;
  host& operator=( const host& ) = delete;
  host& operator=( host&& )      = delete;

  std::error_code write( comitia::program::file_descriptor fd, std::span< const std::byte > buffer ) override;
  std::error_code read( comitia::program::file_descriptor fd, std::span< std::byte > buffer ) override;

  comitia::program::result< std::string > read_record() override;
  std::error_code write_record( std::string_view bytes ) override;

  comitia::program::result< comitia::protocol::account > get_caller() override;
  std::uint32_t get_time() override;

  std::error_code notify_execution( std::uint32_t proposal_id, std::uint32_t operation_id ) override;

  void set_input( std::vector< std::byte > input );

  template< std::integral T >
  T output_as() const
  {
    T t{};
    if( stdout_bytes.size() != sizeof( T ) )
    {
      ADD_FAILURE() << "expected " << sizeof( T ) << " bytes of output, found " << stdout_bytes.size();
      return t;
    }

    std::copy_n( stdout_bytes.begin(), sizeof( T ), comitia::memory::as_writable_bytes( t ).begin() );
    boost::endian::little_to_native_inplace( t );
    return t;
  }

  std::string record;
  std::uint32_t time = 0;
  comitia::protocol::account caller{};

  // Consumed one per get_caller() call before falling back to caller.
  std::deque< comitia::protocol::account > caller_sequence;

  execution_callback on_execution;
  std::vector< std::pair< std::uint32_t, std::uint32_t > > executions;

  std::vector< std::byte > stdout_bytes;
  std::size_t record_writes = 0;
  bool fail_record_write    = false;

private:
  std::vector< std::byte > _stdin;
  std::size_t _stdin_position = 0;
};

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  template< std::integral T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    boost::endian::native_to_little_inplace( t );
    const auto bytes = comitia::memory::as_bytes( t );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  void append_stdin( std::vector< std::byte >& input, const comitia::protocol::account& a ) const noexcept
  {
    const auto bytes = comitia::memory::as_bytes( a );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< typename T >
    requires std::is_enum_v< T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    return append_stdin( input, std::to_underlying( t ) );
  }

  template< typename... Args >
  std::vector< std::byte > make_stdin( Args... args ) const noexcept
  {
    std::vector< std::byte > input;
    ( ( append_stdin( input, std::forward< Args >( args ) ) ), ... );
    return input;
  }

  // Runs a fresh program over the host with the given stdin.
  template< typename... Args >
  std::error_code run( host& h, Args... args )
  {
    h.stdout_bytes.clear();
    h.set_input( make_stdin( std::forward< Args >( args )... ) );
    comitia::program::dao program( _settings );
    return program.run( &h );
  }

  comitia::record::record ledger( const host& h ) const;

  comitia::governance::settings _settings;
  std::filesystem::path _state_dir;
};

} // namespace test
