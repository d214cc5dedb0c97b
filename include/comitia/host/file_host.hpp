#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <comitia/program/system_interface.hpp>
#include <comitia/protocol/account.hpp>

namespace comitia::host {

/**
 * Hosts the governance program over a record file. A missing file reads as
 * an empty record. Writes go to a sibling temporary file that is renamed
 * over the record, so a failed write never leaves a partial record behind.
 */
class file_host final: public program::system_interface
{
public:
  file_host( std::filesystem::path record_path, const protocol::account& caller, std::optional< std::uint32_t > time );
  file_host( const file_host& ) = delete;
  file_host( file_host&& )      = delete;
  ~file_host() override         = default;

  file_host& operator=( const file_host& ) = delete;
  file_host& operator=( file_host&& )      = delete;

  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) override;
  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) override;

  program::result< std::string > read_record() override;
  std::error_code write_record( std::string_view bytes ) override;

  program::result< protocol::account > get_caller() override;
  std::uint32_t get_time() override;

  std::error_code notify_execution( std::uint32_t proposal_id, std::uint32_t operation_id ) override;

  void set_input( std::vector< std::byte > input );
  std::span< const std::byte > output() const noexcept;

private:
  std::filesystem::path _record_path;
  protocol::account _caller;
  std::optional< std::uint32_t > _time;
  std::vector< std::byte > _input;
  std::size_t _input_position = 0;
  std::vector< std::byte > _output;
};

} // namespace comitia::host
