#pragma once

#include <cstdint>
#include <string_view>

#include <comitia/record/record.hpp>

namespace comitia::timelock {

enum class operation_state : std::uint8_t
{
  unset,
  pending,
  ready,
  done,
  expired
};

struct operation
{
  std::uint32_t id             = 0;
  std::uint32_t proposal_id    = 0;
  std::uint32_t ready_at       = 0;
  operation_state stored_state = operation_state::unset;
  std::uint32_t predecessor_id = 0;
};

struct schedule_receipt
{
  record::record ledger;
  std::uint32_t operation_id = 0;
  std::uint8_t index         = 0;
};

std::string_view to_string( operation_state s ) noexcept;

} // namespace comitia::timelock
