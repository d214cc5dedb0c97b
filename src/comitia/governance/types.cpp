#include <comitia/governance/types.hpp>

#include <utility>

namespace comitia::governance {

std::string_view to_string( proposal_state s ) noexcept
{
  switch( s )
  {
    case proposal_state::pending:
      return "pending";
    case proposal_state::active:
      return "active";
    case proposal_state::canceled:
      return "canceled";
    case proposal_state::defeated:
      return "defeated";
    case proposal_state::succeeded:
      return "succeeded";
    case proposal_state::queued:
      return "queued";
    case proposal_state::expired:
      return "expired";
    case proposal_state::executed:
      return "executed";
  }
  std::unreachable();
}

std::string_view to_string( vote_type v ) noexcept
{
  switch( v )
  {
    case vote_type::against:
      return "against";
    case vote_type::in_favor:
      return "for";
    case vote_type::abstain:
      return "abstain";
  }
  std::unreachable();
}

} // namespace comitia::governance
