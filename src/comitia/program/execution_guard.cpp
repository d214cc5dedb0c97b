#include <comitia/program/execution_guard.hpp>

#include <comitia/governance/error.hpp>
#include <comitia/log.hpp>

#include <utility>

namespace comitia::program {

using governance::governance_errc;

execution_guard::execution_guard( system_interface* system, const governance::governor& governor ) noexcept:
    _system( system ),
    _governor( governor )
{}

execution_guard::~execution_guard()
{
  release();
}

std::error_code execution_guard::acquire( const record::record& original )
{
  if( _original )
    return governance_errc::reentrant;

  if( _governor.is_locked( original ) )
    return governance_errc::reentrant;

  auto locked = _governor.set_lock( original, true );
  if( !locked )
    return locked.error();

  if( auto ec = _system->write_record( locked->data() ); ec )
    return governance_errc::host_call;

  _original = original;
  _locked   = std::move( *locked );
  return {};
}

const record::record& execution_guard::locked() const
{
  return _locked.value();
}

std::error_code execution_guard::commit( const record::record& final_record )
{
  if( !_original || _committed )
    return governance_errc::host_call;

  auto unlocked = _governor.set_lock( final_record, false );
  if( !unlocked )
    return unlocked.error();

  if( auto ec = _system->write_record( unlocked->data() ); ec )
    return governance_errc::host_call;

  _committed = true;
  return {};
}

bool execution_guard::held() const noexcept
{
  return _original.has_value() && !_committed;
}

void execution_guard::release() noexcept
{
  if( !held() )
    return;

  if( auto ec = _system->write_record( _original->data() ); ec )
    LOG_ERROR( log::instance(), "Unable to restore record after failed execution: {}", ec.message() );
}

} // namespace comitia::program
