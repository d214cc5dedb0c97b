#pragma once

#include <optional>
#include <system_error>

#include <comitia/governance/governor.hpp>
#include <comitia/program/system_interface.hpp>
#include <comitia/record/record.hpp>

namespace comitia::program {

/**
 * Holds the reentrancy lock for the duration of an execution. acquire()
 * persists the record with the lock set so that any call back into the
 * program while the guard is held sees it. Unless commit() succeeds, the
 * destructor writes the original record back.
 */
class execution_guard final
{
public:
  execution_guard( system_interface* system, const governance::governor& governor ) noexcept;
  execution_guard( const execution_guard& ) = delete;
  execution_guard( execution_guard&& )      = delete;
  ~execution_guard();

  execution_guard& operator=( const execution_guard& ) = delete;
  execution_guard& operator=( execution_guard&& )      = delete;

  std::error_code acquire( const record::record& original );

  // The record as persisted while the lock is held.
  const record::record& locked() const;

  // Writes the final record with the lock released.
  std::error_code commit( const record::record& final_record );

  bool held() const noexcept;

private:
  void release() noexcept;

  system_interface* _system;
  const governance::governor& _governor;
  std::optional< record::record > _original;
  std::optional< record::record > _locked;
  bool _committed = false;
};

} // namespace comitia::program
