#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <comitia/program/error.hpp>
#include <comitia/protocol/account.hpp>

namespace comitia::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout,
  stderr
};

/**
 * What a governance program needs from the environment hosting it. The
 * record is replaced as a whole and only when an action succeeds.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer )        = 0;

  virtual result< std::string > read_record()                   = 0;
  virtual std::error_code write_record( std::string_view bytes ) = 0;

  virtual result< protocol::account > get_caller() = 0;
  virtual std::uint32_t get_time()                = 0;

  // Called while an execution holds the reentrancy lock.
  virtual std::error_code notify_execution( std::uint32_t proposal_id, std::uint32_t operation_id ) = 0;
};

} // namespace comitia::program
