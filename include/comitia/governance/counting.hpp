#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <comitia/governance/error.hpp>
#include <comitia/governance/governor.hpp>
#include <comitia/governance/settings.hpp>
#include <comitia/governance/types.hpp>
#include <comitia/protocol/account.hpp>
#include <comitia/record/record.hpp>

namespace comitia::governance {

// Vote values are stored as <40-hex-voter>:<support>:<weight>.
std::string format_vote( const vote_record& v );
result< vote_record > parse_vote( std::string_view value ) noexcept;

result< vote_type > to_vote_type( std::uint8_t support ) noexcept;

/**
 * Simple counting: one vote per account and proposal, for, against or
 * abstain. Existence of a vote record is the only double vote guard.
 */
class counting final
{
public:
  explicit counting( const settings& s ) noexcept;

  result< record::record > cast_vote( const record::record& r,
                                      std::uint8_t proposal_index,
                                      const protocol::account& voter,
                                      std::uint8_t support,
                                      std::uint64_t weight,
                                      std::uint32_t now,
                                      std::uint64_t total_power ) const;

  bool has_voted( const record::record& r, std::uint8_t proposal_index, const protocol::account& voter ) const;

  std::optional< vote_record >
  get_vote( const record::record& r, std::uint8_t proposal_index, const protocol::account& voter ) const;

  tally proposal_votes( const record::record& r, std::uint8_t proposal_index ) const;

  bool quorum_reached( const record::record& r, std::uint8_t proposal_index, std::uint64_t total_power ) const;
  bool vote_succeeded( const record::record& r, std::uint8_t proposal_index ) const;

  // Number of consecutive vote records stored for the proposal.
  std::size_t vote_count( const record::record& r, std::uint8_t proposal_index ) const;

private:
  settings _settings;
  governor _governor;
};

} // namespace comitia::governance
