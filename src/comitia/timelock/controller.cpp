#include <comitia/timelock/controller.hpp>

#include <comitia/crypto.hpp>
#include <comitia/encode/decimal.hpp>
#include <comitia/governance/arithmetic.hpp>
#include <comitia/record/key.hpp>

#include <array>
#include <limits>
#include <utility>

namespace comitia::timelock {

using governance::governance_errc;
namespace field = record::key::operation_field;

controller::controller( const governance::settings& s ) noexcept:
    _settings( s )
{}

std::uint8_t controller::operation_count( const record::record& r ) const noexcept
{
  return record::read_count( r, record::key::operation_count );
}

std::optional< operation_state > controller::stored_state( const record::record& r, std::uint8_t index ) const
{
  auto value = record::read_number< std::uint8_t >( r, record::key::operation( index, field::state ) );
  if( !value || *value > std::to_underlying( operation_state::expired ) )
    return std::nullopt;

  return static_cast< operation_state >( *value );
}

result< operation_state > controller::state( const record::record& r, std::uint8_t index, std::uint32_t now ) const
{
  if( index >= operation_count( r ) )
    return std::unexpected( governance_errc::operation_not_found );

  auto stored = stored_state( r, index );
  if( !stored )
    return std::unexpected( governance_errc::operation_not_found );

  if( *stored != operation_state::pending )
    return *stored;

  auto ready_at = record::read_number< std::uint32_t >( r, record::key::operation( index, field::ready_at ) );
  if( !ready_at )
    return std::unexpected( governance_errc::data_read );

  if( now < *ready_at )
    return operation_state::pending;

  if( now > governance::saturating_add( *ready_at, _settings.timelock_grace_period ) )
    return operation_state::expired;

  return operation_state::ready;
}

result< schedule_receipt > controller::schedule( const record::record& r,
                                                 std::uint32_t proposal_id,
                                                 std::uint32_t now,
                                                 std::uint32_t delay ) const
{
  if( delay < _settings.timelock_min_delay )
    return std::unexpected( governance_errc::too_early );

  if( auto existing = find_by_proposal( r, proposal_id ); existing )
  {
    auto s = state( r, *existing, now );
    if( s && ( *s == operation_state::pending || *s == operation_state::ready ) )
      return std::unexpected( governance_errc::op_already_queued );
  }

  auto count = operation_count( r );
  if( count >= _settings.max_operations || count == std::numeric_limits< std::uint8_t >::max() )
    return std::unexpected( governance_errc::capacity_exceeded );

  auto ready_at = governance::checked_add( now, delay );
  if( !ready_at )
    return std::unexpected( governance_errc::overflow );

  auto id = crypto::operation_id( proposal_id, now, count );

  auto id_key       = record::key::operation( count, field::id );
  auto proposal_key = record::key::operation( count, field::proposal );
  auto ready_key    = record::key::operation( count, field::ready_at );
  auto state_key    = record::key::operation( count, field::state );

  auto new_count   = encode::to_decimal( std::uint8_t( count + 1 ) );
  auto id_value    = encode::to_decimal( id );
  auto prop_value  = encode::to_decimal( proposal_id );
  auto ready_value = encode::to_decimal( *ready_at );
  auto state_value = encode::to_decimal( std::to_underlying( operation_state::pending ) );

  const std::array< record::entry, 5 > fields{
    record::entry{ .key = record::key::operation_count, .value = new_count },
    record::entry{ .key = id_key, .value = id_value },
    record::entry{ .key = proposal_key, .value = prop_value },
    record::entry{ .key = ready_key, .value = ready_value },
    record::entry{ .key = state_key, .value = state_value }
  };

  auto updated = r.rewrite( fields );
  if( !updated )
    return std::unexpected( updated.error() );

  return schedule_receipt{ .ledger = std::move( *updated ), .operation_id = id, .index = count };
}

result< record::record > controller::execute( const record::record& r, std::uint8_t index, std::uint32_t now ) const
{
  auto s = state( r, index, now );
  if( !s )
    return std::unexpected( s.error() );

  if( *s == operation_state::expired )
    return std::unexpected( governance_errc::op_expired );

  if( *s != operation_state::ready )
    return std::unexpected( governance_errc::op_not_ready );

  return set_state( r, index, operation_state::done );
}

result< record::record > controller::cancel( const record::record& r, std::uint8_t index, std::uint32_t now ) const
{
  auto s = state( r, index, now );
  if( !s )
    return std::unexpected( s.error() );

  if( *s != operation_state::pending && *s != operation_state::ready )
    return std::unexpected( governance_errc::op_not_ready );

  return set_state( r, index, operation_state::unset );
}

bool controller::is_pending( const record::record& r, std::uint8_t index, std::uint32_t now ) const
{
  auto s = state( r, index, now );
  return s && *s == operation_state::pending;
}

bool controller::is_ready( const record::record& r, std::uint8_t index, std::uint32_t now ) const
{
  auto s = state( r, index, now );
  return s && *s == operation_state::ready;
}

bool controller::is_done( const record::record& r, std::uint8_t index ) const
{
  return stored_state( r, index ) == operation_state::done;
}

bool controller::is_expired( const record::record& r, std::uint8_t index, std::uint32_t now ) const
{
  auto s = state( r, index, now );
  return s && *s == operation_state::expired;
}

std::uint32_t controller::timestamp( const record::record& r, std::uint8_t index ) const
{
  return record::read_number< std::uint32_t >( r, record::key::operation( index, field::ready_at ) ).value_or( 0 );
}

result< std::uint8_t > controller::find_by_proposal( const record::record& r, std::uint32_t proposal_id ) const
{
  for( auto i = operation_count( r ); i > 0; --i )
  {
    auto index  = std::uint8_t( i - 1 );
    auto linked = record::read_number< std::uint32_t >( r, record::key::operation( index, field::proposal ) );
    if( linked && *linked == proposal_id )
      return index;
  }

  return std::unexpected( governance_errc::operation_not_found );
}

result< std::uint8_t > controller::find_by_id( const record::record& r, std::uint32_t operation_id ) const
{
  auto count = operation_count( r );
  for( std::uint8_t i = 0; i < count; ++i )
  {
    auto id = record::read_number< std::uint32_t >( r, record::key::operation( i, field::id ) );
    if( id && *id == operation_id )
      return i;
  }

  return std::unexpected( governance_errc::operation_not_found );
}

result< operation > controller::get_operation( const record::record& r, std::uint8_t index ) const
{
  if( index >= operation_count( r ) )
    return std::unexpected( governance_errc::operation_not_found );

  auto id       = record::read_number< std::uint32_t >( r, record::key::operation( index, field::id ) );
  auto proposal = record::read_number< std::uint32_t >( r, record::key::operation( index, field::proposal ) );
  auto ready_at = record::read_number< std::uint32_t >( r, record::key::operation( index, field::ready_at ) );
  auto stored   = stored_state( r, index );

  if( !id || !proposal || !ready_at || !stored )
    return std::unexpected( governance_errc::operation_not_found );

  return operation{
    .id             = *id,
    .proposal_id    = *proposal,
    .ready_at       = *ready_at,
    .stored_state   = *stored,
    .predecessor_id = record::read_number< std::uint32_t >( r, record::key::operation( index, field::predecessor ) )
                        .value_or( 0 )
  };
}

result< record::record > controller::set_state( const record::record& r, std::uint8_t index, operation_state s ) const
{
  return r.update( record::key::operation( index, field::state ), encode::to_decimal( std::to_underlying( s ) ) );
}

} // namespace comitia::timelock
