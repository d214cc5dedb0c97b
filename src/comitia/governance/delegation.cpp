#include <comitia/governance/delegation.hpp>

#include <comitia/encode/decimal.hpp>
#include <comitia/governance/arithmetic.hpp>
#include <comitia/record/key.hpp>

namespace comitia::governance {

delegation::delegation( const settings& s ) noexcept:
    _membership( s )
{}

result< record::record > delegation::delegate( const record::record& r,
                                               const protocol::account& voter,
                                               const protocol::account& target ) const
{
  auto key = record::key::delegate( voter );

  if( voter == target )
    return r.erase( key );

  return r.rewrite( key, protocol::to_hex( target ) );
}

protocol::account delegation::get_delegate( const record::record& r, const protocol::account& voter ) const
{
  auto value = r.find( record::key::delegate( voter ) );
  if( !value || value->size() != protocol::account_hex_length )
    return voter;

  auto target = protocol::account_from_hex( *value );
  if( !target )
    return voter;

  return *target;
}

std::uint64_t delegation::effective_votes( const record::record& r, const protocol::account& account ) const
{
  std::uint64_t power = 0;

  for( const auto& m: _membership.members( r ) )
  {
    if( get_delegate( r, m.account ) != account )
      continue;

    power = saturating_add( power, m.voting_power );
  }

  return power;
}

result< record::record > delegation::snapshot_voting_power( const record::record& r,
                                                            std::uint32_t proposal_id,
                                                            const protocol::account& account ) const
{
  auto key = record::key::snapshot( proposal_id, account );
  if( r.contains( key ) )
    return r;

  return r.append_entry( key, encode::to_decimal( effective_votes( r, account ) ) );
}

std::uint64_t delegation::snapshot_votes( const record::record& r,
                                          std::uint32_t proposal_id,
                                          const protocol::account& account ) const
{
  return record::read_number< std::uint64_t >( r, record::key::snapshot( proposal_id, account ) ).value_or( 0 );
}

} // namespace comitia::governance
