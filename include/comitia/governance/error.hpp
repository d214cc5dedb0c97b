#pragma once

#include <expected>
#include <system_error>

namespace comitia::governance {

// Values are the negated exit codes reported to the host.
enum class governance_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  wrong_account,
  too_early,
  not_approved,
  data_read,
  host_call,
  bad_config,
  already_voted,
  proposal_not_active,
  below_threshold,
  max_proposals_reached,
  not_proposer,
  not_executor,
  op_not_ready,
  op_already_queued,
  proposal_not_found,
  invalid_vote,
  quorum_not_met,
  not_admin,
  overflow,
  reentrant,
  op_expired,
  caller_verification,
  not_member,
  capacity_exceeded,
  operation_not_found
};

const std::error_category& governance_category() noexcept;

std::error_code make_error_code( governance_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace comitia::governance

template<>
struct std::is_error_code_enum< comitia::governance::governance_errc >: public std::true_type
{};
