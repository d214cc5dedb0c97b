#include <comitia/governance/error.hpp>

#include <string>
#include <utility>

namespace comitia::governance {

struct _governance_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "governance";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< governance_errc >( condition ) )
    {
      case governance_errc::ok:
        return "ok"s;
      case governance_errc::wrong_account:
        return "wrong account"s;
      case governance_errc::too_early:
        return "delay below the timelock minimum"s;
      case governance_errc::not_approved:
        return "not approved"s;
      case governance_errc::data_read:
        return "unable to read record"s;
      case governance_errc::host_call:
        return "host call failed"s;
      case governance_errc::bad_config:
        return "bad configuration"s;
      case governance_errc::already_voted:
        return "already voted"s;
      case governance_errc::proposal_not_active:
        return "proposal not in the required state"s;
      case governance_errc::below_threshold:
        return "voting power below proposal threshold"s;
      case governance_errc::max_proposals_reached:
        return "maximum number of proposals reached"s;
      case governance_errc::not_proposer:
        return "caller is not the proposer"s;
      case governance_errc::not_executor:
        return "caller is not an executor"s;
      case governance_errc::op_not_ready:
        return "operation not ready"s;
      case governance_errc::op_already_queued:
        return "operation already queued"s;
      case governance_errc::proposal_not_found:
        return "proposal not found"s;
      case governance_errc::invalid_vote:
        return "invalid vote"s;
      case governance_errc::quorum_not_met:
        return "quorum not met"s;
      case governance_errc::not_admin:
        return "caller is not an admin"s;
      case governance_errc::overflow:
        return "arithmetic overflow"s;
      case governance_errc::reentrant:
        return "reentrant call"s;
      case governance_errc::op_expired:
        return "operation expired"s;
      case governance_errc::caller_verification:
        return "caller identity mismatch"s;
      case governance_errc::not_member:
        return "account is not a member"s;
      case governance_errc::capacity_exceeded:
        return "capacity exceeded"s;
      case governance_errc::operation_not_found:
        return "operation not found"s;
    }
    std::unreachable();
  }
};

const std::error_category& governance_category() noexcept
{
  static _governance_category category;
  return category;
}

std::error_code make_error_code( governance_errc e )
{
  return std::error_code( static_cast< int >( e ), governance_category() );
}

} // namespace comitia::governance
