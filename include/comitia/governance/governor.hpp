#pragma once

#include <cstdint>

#include <comitia/governance/error.hpp>
#include <comitia/governance/settings.hpp>
#include <comitia/governance/types.hpp>
#include <comitia/protocol/account.hpp>
#include <comitia/record/record.hpp>
#include <comitia/timelock.hpp>

namespace comitia::governance {

struct proposal_receipt
{
  record::record ledger;
  std::uint32_t proposal_id = 0;
  std::uint8_t index        = 0;
};

struct queue_receipt
{
  record::record ledger;
  std::uint32_t operation_id = 0;
};

/**
 * Proposal lifecycle: propose, vote, queue and execute. Only canceled,
 * queued, executed and expired are written to a proposal's state field.
 * Pending, active, succeeded and defeated are derived on every read from the
 * voting window and the tallies.
 */
class governor final
{
public:
  explicit governor( const settings& s ) noexcept;

  result< proposal_receipt > propose( const record::record& r,
                                      const protocol::account& proposer,
                                      std::uint32_t description_hash,
                                      std::uint32_t now,
                                      std::uint64_t proposer_power ) const;

  result< proposal_state >
  state( const record::record& r, std::uint8_t index, std::uint32_t now, std::uint64_t total_power ) const;

  result< record::record > cancel( const record::record& r,
                                   std::uint8_t index,
                                   const protocol::account& caller,
                                   std::uint32_t now,
                                   std::uint64_t total_power ) const;

  result< std::uint8_t > find_by_id( const record::record& r, std::uint32_t proposal_id ) const;
  result< proposal > get_proposal( const record::record& r, std::uint8_t index ) const;
  std::uint8_t proposal_count( const record::record& r ) const noexcept;

  bool is_locked( const record::record& r ) const noexcept;
  result< record::record > set_lock( const record::record& r, bool locked ) const;

  // Schedules the timelock operation of a succeeded proposal.
  result< queue_receipt >
  queue( const record::record& r, std::uint8_t index, std::uint32_t now, std::uint64_t total_power ) const;

  // Runs the proposal's timelock operation and marks the proposal executed.
  result< record::record > execute( const record::record& r, std::uint8_t index, std::uint32_t now ) const;

  const timelock::operations& timelock() const noexcept;

private:
  result< record::record > set_state( const record::record& r, std::uint8_t index, proposal_state s ) const;

  settings _settings;
  timelock::operations _operations;
};

} // namespace comitia::governance
