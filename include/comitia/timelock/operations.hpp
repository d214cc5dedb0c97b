#pragma once

#include <cstdint>

#include <comitia/governance/settings.hpp>
#include <comitia/record/record.hpp>
#include <comitia/timelock/controller.hpp>
#include <comitia/timelock/types.hpp>

namespace comitia::timelock {

/**
 * Operations that depend on a single predecessor. A predecessor id of zero
 * means no dependency. Only the direct predecessor is checked, never its own
 * predecessor.
 */
class operations final
{
public:
  explicit operations( const governance::settings& s ) noexcept;

  result< schedule_receipt > schedule_with_predecessor( const record::record& r,
                                                        std::uint32_t proposal_id,
                                                        std::uint32_t predecessor_id,
                                                        std::uint32_t now,
                                                        std::uint32_t delay ) const;

  result< record::record >
  execute_with_predecessor_check( const record::record& r, std::uint8_t index, std::uint32_t now ) const;

  std::uint32_t predecessor( const record::record& r, std::uint8_t index ) const;

  const controller& timelock() const noexcept;

private:
  bool predecessor_done( const record::record& r, std::uint32_t predecessor_id ) const;

  controller _controller;
};

} // namespace comitia::timelock
