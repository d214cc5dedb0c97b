#pragma once

#include <cstdint>
#include <string_view>

#include <comitia/protocol/account.hpp>

namespace comitia::governance {

enum class proposal_state : std::uint8_t
{
  pending,
  active,
  canceled,
  defeated,
  succeeded,
  queued,
  expired,
  executed
};

enum class vote_type : std::uint8_t
{
  against,
  in_favor,
  abstain
};

namespace role {

constexpr std::uint8_t proposer = 1;
constexpr std::uint8_t executor = 2;
constexpr std::uint8_t admin    = 4;

} // namespace role

struct member
{
  protocol::account account{};
  std::uint64_t voting_power = 0;
  std::uint8_t roles         = 0;

  bool has_role( std::uint8_t role ) const noexcept
  {
    return ( roles & role ) != 0;
  }
};

struct proposal
{
  std::uint32_t id = 0;
  protocol::account proposer{};
  std::uint32_t vote_start      = 0;
  std::uint32_t vote_end        = 0;
  proposal_state stored_state   = proposal_state::pending;
  std::uint64_t for_votes       = 0;
  std::uint64_t against_votes   = 0;
  std::uint64_t abstain_votes   = 0;
  std::uint32_t description_hash = 0;
};

struct vote_record
{
  protocol::account voter{};
  vote_type support    = vote_type::against;
  std::uint64_t weight = 0;
};

struct tally
{
  std::uint64_t for_votes     = 0;
  std::uint64_t against_votes = 0;
  std::uint64_t abstain_votes = 0;

  bool operator==( const tally& ) const = default;
};

std::string_view to_string( proposal_state s ) noexcept;
std::string_view to_string( vote_type v ) noexcept;

} // namespace comitia::governance
