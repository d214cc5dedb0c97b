#pragma once

#include <cstdint>

#include <comitia/governance/error.hpp>
#include <comitia/governance/membership.hpp>
#include <comitia/governance/settings.hpp>
#include <comitia/protocol/account.hpp>
#include <comitia/record/record.hpp>

namespace comitia::governance {

/**
 * Single level vote delegation. An account without a delegate_ entry is
 * delegated to itself. A delegate's own delegation is never followed, so
 * power moves at most one hop.
 */
class delegation final
{
public:
  explicit delegation( const settings& s ) noexcept;

  // Delegating to oneself removes the entry.
  result< record::record >
  delegate( const record::record& r, const protocol::account& voter, const protocol::account& target ) const;

  protocol::account get_delegate( const record::record& r, const protocol::account& voter ) const;

  std::uint64_t effective_votes( const record::record& r, const protocol::account& account ) const;

  // Written once per proposal and account, later calls leave the record as is.
  result< record::record >
  snapshot_voting_power( const record::record& r, std::uint32_t proposal_id, const protocol::account& account ) const;

  std::uint64_t
  snapshot_votes( const record::record& r, std::uint32_t proposal_id, const protocol::account& account ) const;

private:
  membership _membership;
};

} // namespace comitia::governance
