#pragma once

#include <cstddef>
#include <cstdint>

#include <comitia/record/record.hpp>

namespace comitia::governance {

struct settings
{
  // Seconds between proposal creation and the start of voting.
  std::uint32_t voting_delay = 300;

  // Seconds voting stays open.
  std::uint32_t voting_period = 259'200;

  // Minimum effective voting power needed to propose.
  std::uint64_t proposal_threshold = 100'000'000;

  // Percentage of total voting power that For and Abstain must reach.
  std::uint8_t quorum_percentage = 4;

  std::uint32_t timelock_min_delay    = 172'800;
  std::uint32_t timelock_grace_period = 1'209'600;

  std::uint64_t self_register_initial_power = 0;

  std::size_t max_members    = 20;
  std::size_t max_proposals  = 10;
  std::size_t max_operations = 255;

  std::size_t record_capacity = record::default_capacity;
};

} // namespace comitia::governance
