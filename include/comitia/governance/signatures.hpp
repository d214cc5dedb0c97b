#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <comitia/governance/error.hpp>
#include <comitia/protocol/account.hpp>
#include <comitia/record/record.hpp>

namespace comitia::governance {

constexpr std::string_view vote_message_prefix = "comitia:vote:";

// comitia:vote:<proposal id>:<support>:<40-hex voter>
std::string build_vote_message( std::uint32_t proposal_id, std::uint8_t support, const protocol::account& voter );

std::uint32_t vote_message_hash( std::string_view message ) noexcept;

bool validate_vote_message( std::uint32_t proposal_id, std::uint8_t support, const protocol::account& voter ) noexcept;

/**
 * Records a vote submitted on behalf of a voter as a sigvote_ entry. The
 * intent is stored only; it does not change any tally.
 */
result< record::record > record_vote_intent( const record::record& r,
                                             std::uint32_t proposal_id,
                                             std::uint8_t support,
                                             const protocol::account& voter );

} // namespace comitia::governance
