#include <comitia/governance/membership.hpp>

#include <comitia/encode/decimal.hpp>
#include <comitia/governance/arithmetic.hpp>
#include <comitia/record/key.hpp>

#include <array>
#include <limits>

namespace comitia::governance {

constexpr std::uint64_t percent = 100;

std::string format_member( const member& m )
{
  std::string value = protocol::to_hex( m.account );
  value.push_back( member_field_separator );
  value += encode::to_decimal( m.voting_power );
  value.push_back( member_field_separator );
  value += encode::to_decimal( m.roles );
  return value;
}

result< member > parse_member( std::string_view value ) noexcept
{
  if( value.size() < protocol::account_hex_length + 4 || value[ protocol::account_hex_length ] != member_field_separator )
    return std::unexpected( governance_errc::data_read );

  auto account = protocol::account_from_hex( value.substr( 0, protocol::account_hex_length ) );
  if( !account )
    return std::unexpected( governance_errc::data_read );

  auto rest      = value.substr( protocol::account_hex_length + 1 );
  auto separator = rest.find( member_field_separator );
  if( separator == std::string_view::npos )
    return std::unexpected( governance_errc::data_read );

  auto power = encode::from_decimal< std::uint64_t >( rest.substr( 0, separator ) );
  auto roles = encode::from_decimal< std::uint8_t >( rest.substr( separator + 1 ) );
  if( !power || !roles )
    return std::unexpected( governance_errc::data_read );

  return member{ .account = *account, .voting_power = *power, .roles = *roles };
}

std::uint64_t quorum( std::uint64_t total_voting_power, std::uint8_t percentage ) noexcept
{
  return saturating_mul( total_voting_power / percent, std::uint64_t( percentage ) );
}

membership::membership( const settings& s ) noexcept:
    _settings( s )
{}

std::optional< membership::located > membership::locate( const record::record& r,
                                                         const protocol::account& account ) const
{
  auto count = member_count( r );
  for( std::uint8_t i = 0; i < count; ++i )
  {
    auto value = r.find( record::key::member( i ) );
    if( !value )
      continue;

    auto m = parse_member( *value );
    if( m && m->account == account )
      return located{ .index = i, .value = *m };
  }

  return std::nullopt;
}

std::optional< member > membership::find_member( const record::record& r, const protocol::account& account ) const
{
  if( auto l = locate( r, account ); l )
    return l->value;

  return std::nullopt;
}

std::vector< member > membership::members( const record::record& r ) const
{
  std::vector< member > result;

  auto count = member_count( r );
  for( std::uint8_t i = 0; i < count; ++i )
  {
    auto value = r.find( record::key::member( i ) );
    if( !value )
      continue;

    if( auto m = parse_member( *value ); m )
      result.push_back( *m );
  }

  return result;
}

std::uint8_t membership::member_count( const record::record& r ) const noexcept
{
  return record::read_count( r, record::key::member_count );
}

std::uint64_t membership::get_votes( const record::record& r, const protocol::account& account ) const
{
  if( auto m = find_member( r, account ); m )
    return m->voting_power;

  return 0;
}

std::uint8_t membership::get_roles( const record::record& r, const protocol::account& account ) const
{
  if( auto m = find_member( r, account ); m )
    return m->roles;

  return 0;
}

bool membership::has_role( const record::record& r, const protocol::account& account, std::uint8_t role ) const
{
  return ( get_roles( r, account ) & role ) != 0;
}

std::uint64_t membership::total_voting_power( const record::record& r ) const
{
  std::uint64_t total = 0;
  for( const auto& m: members( r ) )
    total = saturating_add( total, m.voting_power );

  return total;
}

std::uint64_t membership::quorum( std::uint64_t total_voting_power ) const noexcept
{
  return governance::quorum( total_voting_power, _settings.quorum_percentage );
}

result< record::record > membership::set_member( const record::record& r,
                                                 const protocol::account& account,
                                                 std::uint64_t power,
                                                 std::uint8_t roles ) const
{
  auto value = format_member( member{ .account = account, .voting_power = power, .roles = roles } );

  if( auto l = locate( r, account ); l )
    return r.update( record::key::member( l->index ), value );

  auto count = member_count( r );
  if( count >= _settings.max_members || count == std::numeric_limits< std::uint8_t >::max() )
    return std::unexpected( governance_errc::bad_config );

  auto key       = record::key::member( count );
  auto new_count = encode::to_decimal( std::uint8_t( count + 1 ) );

  const std::array< record::entry, 2 > fields{
    record::entry{ .key = key, .value = value },
    record::entry{ .key = record::key::member_count, .value = new_count }
  };

  return r.rewrite( fields );
}

result< record::record >
membership::grant_role( const record::record& r, const protocol::account& account, std::uint8_t role ) const
{
  auto current = find_member( r, account ).value_or( member{ .account = account } );
  return set_member( r, account, current.voting_power, std::uint8_t( current.roles | role ) );
}

result< record::record >
membership::revoke_role( const record::record& r, const protocol::account& account, std::uint8_t role ) const
{
  auto current = find_member( r, account );
  if( !current )
    return std::unexpected( governance_errc::not_member );

  return set_member( r, account, current->voting_power, std::uint8_t( current->roles & ~role ) );
}

result< record::record > membership::register_member( const record::record& r, const protocol::account& account ) const
{
  if( find_member( r, account ) )
    return r;

  return set_member( r, account, _settings.self_register_initial_power, 0 );
}

} // namespace comitia::governance
