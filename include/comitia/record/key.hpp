#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <comitia/protocol/account.hpp>
#include <comitia/record/error.hpp>

namespace comitia::record::key {

constexpr std::string_view member_count    = "member_count";
constexpr std::string_view proposal_count  = "proposal_count";
constexpr std::string_view operation_count = "op_count";
constexpr std::string_view lock            = "_lock";

namespace proposal_field {

constexpr std::string_view id          = "_id";
constexpr std::string_view proposer    = "_proposer";
constexpr std::string_view state       = "_state";
constexpr std::string_view vote_start  = "_start";
constexpr std::string_view vote_end    = "_end";
constexpr std::string_view for_votes   = "_for";
constexpr std::string_view against     = "_against";
constexpr std::string_view abstain     = "_abstain";
constexpr std::string_view description = "_desc";

} // namespace proposal_field

namespace operation_field {

constexpr std::string_view id          = "_id";
constexpr std::string_view proposal    = "_prop";
constexpr std::string_view ready_at    = "_ready";
constexpr std::string_view state       = "_state";
constexpr std::string_view predecessor = "_predecessor";

} // namespace operation_field

// Decimal index of one to three digits with no leading zero.
std::string index( std::uint8_t i );
result< std::uint8_t > parse_index( std::string_view sv ) noexcept;

std::string indexed( std::string_view prefix, std::uint8_t i, std::string_view suffix = {} );

std::string member( std::uint8_t i );
std::string proposal( std::uint8_t i, std::string_view field );
std::string vote( std::uint8_t proposal_index, std::uint8_t vote_index );
std::string operation( std::uint8_t i, std::string_view field );

std::string delegate( const protocol::account& voter );
std::string snapshot( std::uint32_t proposal_id, const protocol::account& account );
std::string signature_vote( std::uint32_t proposal_id, const protocol::account& voter );

} // namespace comitia::record::key
