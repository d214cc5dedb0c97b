#include <comitia/governance/governor.hpp>

#include <comitia/crypto.hpp>
#include <comitia/encode/decimal.hpp>
#include <comitia/governance/arithmetic.hpp>
#include <comitia/governance/membership.hpp>
#include <comitia/record/key.hpp>

#include <array>
#include <limits>
#include <utility>

namespace comitia::governance {

namespace field = record::key::proposal_field;

constexpr std::string_view locked_value   = "1";
constexpr std::string_view unlocked_value = "0";

governor::governor( const settings& s ) noexcept:
    _settings( s ),
    _operations( s )
{}

const timelock::operations& governor::timelock() const noexcept
{
  return _operations;
}

std::uint8_t governor::proposal_count( const record::record& r ) const noexcept
{
  return record::read_count( r, record::key::proposal_count );
}

result< proposal_receipt > governor::propose( const record::record& r,
                                              const protocol::account& proposer,
                                              std::uint32_t description_hash,
                                              std::uint32_t now,
                                              std::uint64_t proposer_power ) const
{
  if( proposer_power < _settings.proposal_threshold )
    return std::unexpected( governance_errc::below_threshold );

  auto count = proposal_count( r );
  if( count >= _settings.max_proposals || count == std::numeric_limits< std::uint8_t >::max() )
    return std::unexpected( governance_errc::max_proposals_reached );

  auto vote_start = checked_add( now, _settings.voting_delay );
  if( !vote_start )
    return std::unexpected( governance_errc::overflow );

  auto vote_end = checked_add( *vote_start, _settings.voting_period );
  if( !vote_end )
    return std::unexpected( governance_errc::overflow );

  auto id = crypto::proposal_id( proposer, description_hash, now, count );

  auto id_key          = record::key::proposal( count, field::id );
  auto proposer_key    = record::key::proposal( count, field::proposer );
  auto state_key       = record::key::proposal( count, field::state );
  auto start_key       = record::key::proposal( count, field::vote_start );
  auto end_key         = record::key::proposal( count, field::vote_end );
  auto for_key         = record::key::proposal( count, field::for_votes );
  auto against_key     = record::key::proposal( count, field::against );
  auto abstain_key     = record::key::proposal( count, field::abstain );
  auto description_key = record::key::proposal( count, field::description );

  auto new_count         = encode::to_decimal( std::uint8_t( count + 1 ) );
  auto id_value          = encode::to_decimal( id );
  auto proposer_value    = protocol::to_hex( proposer );
  auto state_value       = encode::to_decimal( std::to_underlying( proposal_state::pending ) );
  auto start_value       = encode::to_decimal( *vote_start );
  auto end_value         = encode::to_decimal( *vote_end );
  auto description_value = encode::to_decimal( description_hash );

  const std::array< record::entry, 10 > fields{
    record::entry{ .key = record::key::proposal_count, .value = new_count },
    record::entry{ .key = id_key, .value = id_value },
    record::entry{ .key = proposer_key, .value = proposer_value },
    record::entry{ .key = state_key, .value = state_value },
    record::entry{ .key = start_key, .value = start_value },
    record::entry{ .key = end_key, .value = end_value },
    record::entry{ .key = for_key, .value = "0" },
    record::entry{ .key = against_key, .value = "0" },
    record::entry{ .key = abstain_key, .value = "0" },
    record::entry{ .key = description_key, .value = description_value }
  };

  auto updated = r.rewrite( fields );
  if( !updated )
    return std::unexpected( updated.error() );

  return proposal_receipt{ .ledger = std::move( *updated ), .proposal_id = id, .index = count };
}

result< proposal > governor::get_proposal( const record::record& r, std::uint8_t index ) const
{
  if( index >= proposal_count( r ) )
    return std::unexpected( governance_errc::proposal_not_found );

  auto id = record::read_number< std::uint32_t >( r, record::key::proposal( index, field::id ) );
  if( !id )
    return std::unexpected( governance_errc::proposal_not_found );

  auto proposer_hex = r.find( record::key::proposal( index, field::proposer ) );
  if( !proposer_hex )
    return std::unexpected( governance_errc::data_read );

  auto proposer = protocol::account_from_hex( *proposer_hex );
  auto stored   = record::read_number< std::uint8_t >( r, record::key::proposal( index, field::state ) );
  auto start    = record::read_number< std::uint32_t >( r, record::key::proposal( index, field::vote_start ) );
  auto end      = record::read_number< std::uint32_t >( r, record::key::proposal( index, field::vote_end ) );

  if( !proposer || !stored || !start || !end || *stored > std::to_underlying( proposal_state::executed ) )
    return std::unexpected( governance_errc::data_read );

  auto tally_of = [ & ]( std::string_view suffix )
  {
    return record::read_number< std::uint64_t >( r, record::key::proposal( index, suffix ) ).value_or( 0 );
  };

  return proposal{
    .id               = *id,
    .proposer         = *proposer,
    .vote_start       = *start,
    .vote_end         = *end,
    .stored_state     = static_cast< proposal_state >( *stored ),
    .for_votes        = tally_of( field::for_votes ),
    .against_votes    = tally_of( field::against ),
    .abstain_votes    = tally_of( field::abstain ),
    .description_hash =
      record::read_number< std::uint32_t >( r, record::key::proposal( index, field::description ) ).value_or( 0 )
  };
}

result< proposal_state > governor::state( const record::record& r,
                                          std::uint8_t index,
                                          std::uint32_t now,
                                          std::uint64_t total_power ) const
{
  auto p = get_proposal( r, index );
  if( !p )
    return std::unexpected( p.error() );

  switch( p->stored_state )
  {
    case proposal_state::canceled:
    case proposal_state::queued:
    case proposal_state::executed:
    case proposal_state::expired:
      return p->stored_state;
    default:
      break;
  }

  if( now < p->vote_start )
    return proposal_state::pending;

  if( now <= p->vote_end )
    return proposal_state::active;

  if( saturating_add( p->for_votes, p->abstain_votes ) < quorum( total_power, _settings.quorum_percentage ) )
    return proposal_state::defeated;

  return p->for_votes > p->against_votes ? proposal_state::succeeded : proposal_state::defeated;
}

result< record::record > governor::cancel( const record::record& r,
                                           std::uint8_t index,
                                           const protocol::account& caller,
                                           std::uint32_t now,
                                           std::uint64_t total_power ) const
{
  auto p = get_proposal( r, index );
  if( !p )
    return std::unexpected( p.error() );

  if( p->proposer != caller )
    return std::unexpected( governance_errc::not_proposer );

  auto s = state( r, index, now, total_power );
  if( !s )
    return std::unexpected( s.error() );

  if( *s != proposal_state::pending )
    return std::unexpected( governance_errc::proposal_not_active );

  return set_state( r, index, proposal_state::canceled );
}

result< std::uint8_t > governor::find_by_id( const record::record& r, std::uint32_t proposal_id ) const
{
  auto count = proposal_count( r );
  for( std::uint8_t i = 0; i < count; ++i )
  {
    auto id = record::read_number< std::uint32_t >( r, record::key::proposal( i, field::id ) );
    if( id && *id == proposal_id )
      return i;
  }

  return std::unexpected( governance_errc::proposal_not_found );
}

bool governor::is_locked( const record::record& r ) const noexcept
{
  return r.find( record::key::lock ) == locked_value;
}

result< record::record > governor::set_lock( const record::record& r, bool locked ) const
{
  return r.rewrite( record::key::lock, locked ? locked_value : unlocked_value );
}

result< queue_receipt > governor::queue( const record::record& r,
                                         std::uint8_t index,
                                         std::uint32_t now,
                                         std::uint64_t total_power ) const
{
  auto s = state( r, index, now, total_power );
  if( !s )
    return std::unexpected( s.error() );

  if( *s != proposal_state::succeeded )
    return std::unexpected( governance_errc::proposal_not_active );

  auto p = get_proposal( r, index );
  if( !p )
    return std::unexpected( p.error() );

  auto scheduled = _operations.timelock().schedule( r, p->id, now, _settings.timelock_min_delay );
  if( !scheduled )
    return std::unexpected( scheduled.error() );

  auto updated = set_state( scheduled->ledger, index, proposal_state::queued );
  if( !updated )
    return std::unexpected( updated.error() );

  return queue_receipt{ .ledger = std::move( *updated ), .operation_id = scheduled->operation_id };
}

result< record::record > governor::execute( const record::record& r, std::uint8_t index, std::uint32_t now ) const
{
  auto p = get_proposal( r, index );
  if( !p )
    return std::unexpected( p.error() );

  auto op = _operations.timelock().find_by_proposal( r, p->id );
  if( !op )
    return std::unexpected( op.error() );

  auto executed = _operations.execute_with_predecessor_check( r, *op, now );
  if( !executed )
    return executed;

  return set_state( *executed, index, proposal_state::executed );
}

result< record::record > governor::set_state( const record::record& r, std::uint8_t index, proposal_state s ) const
{
  return r.update( record::key::proposal( index, field::state ), encode::to_decimal( std::to_underlying( s ) ) );
}

} // namespace comitia::governance
