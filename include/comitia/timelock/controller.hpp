#pragma once

#include <cstdint>
#include <optional>

#include <comitia/governance/error.hpp>
#include <comitia/governance/settings.hpp>
#include <comitia/record/record.hpp>
#include <comitia/timelock/types.hpp>

namespace comitia::timelock {

using governance::result;

/**
 * Delayed execution of queued proposals. An operation moves from pending to
 * ready once its delay has elapsed and expires when the grace period after
 * that has passed without execution. Only done and unset are stored
 * explicitly; pending, ready and expired are derived from the time given.
 */
class controller final
{
public:
  explicit controller( const governance::settings& s ) noexcept;

  result< schedule_receipt >
  schedule( const record::record& r, std::uint32_t proposal_id, std::uint32_t now, std::uint32_t delay ) const;

  result< record::record > execute( const record::record& r, std::uint8_t index, std::uint32_t now ) const;
  result< record::record > cancel( const record::record& r, std::uint8_t index, std::uint32_t now ) const;

  result< operation_state > state( const record::record& r, std::uint8_t index, std::uint32_t now ) const;

  bool is_pending( const record::record& r, std::uint8_t index, std::uint32_t now ) const;
  bool is_ready( const record::record& r, std::uint8_t index, std::uint32_t now ) const;
  bool is_done( const record::record& r, std::uint8_t index ) const;
  bool is_expired( const record::record& r, std::uint8_t index, std::uint32_t now ) const;

  // Ready time of the operation, zero when unknown.
  std::uint32_t timestamp( const record::record& r, std::uint8_t index ) const;

  // The most recently scheduled operation linked to the proposal.
  result< std::uint8_t > find_by_proposal( const record::record& r, std::uint32_t proposal_id ) const;
  result< std::uint8_t > find_by_id( const record::record& r, std::uint32_t operation_id ) const;

  result< operation > get_operation( const record::record& r, std::uint8_t index ) const;
  std::uint8_t operation_count( const record::record& r ) const noexcept;

private:
  result< record::record >
  set_state( const record::record& r, std::uint8_t index, operation_state s ) const;

  std::optional< operation_state > stored_state( const record::record& r, std::uint8_t index ) const;

  governance::settings _settings;
};

} // namespace comitia::timelock
