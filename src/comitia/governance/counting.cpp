#include <comitia/governance/counting.hpp>

#include <comitia/encode/decimal.hpp>
#include <comitia/governance/arithmetic.hpp>
#include <comitia/governance/membership.hpp>
#include <comitia/record/key.hpp>

#include <array>
#include <limits>
#include <utility>

namespace comitia::governance {

namespace field = record::key::proposal_field;

constexpr char vote_field_separator    = ':';
constexpr std::size_t max_vote_records = std::size_t( std::numeric_limits< std::uint8_t >::max() ) + 1;

std::string format_vote( const vote_record& v )
{
  std::string value = protocol::to_hex( v.voter );
  value.push_back( vote_field_separator );
  value += encode::to_decimal( std::to_underlying( v.support ) );
  value.push_back( vote_field_separator );
  value += encode::to_decimal( v.weight );
  return value;
}

result< vote_record > parse_vote( std::string_view value ) noexcept
{
  if( value.size() < protocol::account_hex_length + 4 || value[ protocol::account_hex_length ] != vote_field_separator )
    return std::unexpected( governance_errc::data_read );

  auto voter = protocol::account_from_hex( value.substr( 0, protocol::account_hex_length ) );
  if( !voter )
    return std::unexpected( governance_errc::data_read );

  auto rest      = value.substr( protocol::account_hex_length + 1 );
  auto separator = rest.find( vote_field_separator );
  if( separator == std::string_view::npos )
    return std::unexpected( governance_errc::data_read );

  auto support = encode::from_decimal< std::uint8_t >( rest.substr( 0, separator ) );
  auto weight  = encode::from_decimal< std::uint64_t >( rest.substr( separator + 1 ) );
  if( !support || !weight )
    return std::unexpected( governance_errc::data_read );

  auto type = to_vote_type( *support );
  if( !type )
    return std::unexpected( governance_errc::data_read );

  return vote_record{ .voter = *voter, .support = *type, .weight = *weight };
}

result< vote_type > to_vote_type( std::uint8_t support ) noexcept
{
  if( support > std::to_underlying( vote_type::abstain ) )
    return std::unexpected( governance_errc::invalid_vote );

  return static_cast< vote_type >( support );
}

counting::counting( const settings& s ) noexcept:
    _settings( s ),
    _governor( s )
{}

std::size_t counting::vote_count( const record::record& r, std::uint8_t proposal_index ) const
{
  std::size_t count = 0;
  while( count < max_vote_records
         && r.contains( record::key::vote( proposal_index, static_cast< std::uint8_t >( count ) ) ) )
    ++count;

  return count;
}

std::optional< vote_record >
counting::get_vote( const record::record& r, std::uint8_t proposal_index, const protocol::account& voter ) const
{
  auto voter_hex = protocol::to_hex( voter );
  auto count     = vote_count( r, proposal_index );

  for( std::size_t i = 0; i < count; ++i )
  {
    auto value = r.find( record::key::vote( proposal_index, static_cast< std::uint8_t >( i ) ) );
    if( !value || !value->starts_with( voter_hex ) )
      continue;

    if( auto v = parse_vote( *value ); v )
      return *v;
  }

  return std::nullopt;
}

bool counting::has_voted( const record::record& r, std::uint8_t proposal_index, const protocol::account& voter ) const
{
  auto voter_hex = protocol::to_hex( voter );
  auto count     = vote_count( r, proposal_index );

  for( std::size_t i = 0; i < count; ++i )
  {
    auto value = r.find( record::key::vote( proposal_index, static_cast< std::uint8_t >( i ) ) );
    if( value && value->starts_with( voter_hex ) )
      return true;
  }

  return false;
}

result< record::record > counting::cast_vote( const record::record& r,
                                              std::uint8_t proposal_index,
                                              const protocol::account& voter,
                                              std::uint8_t support,
                                              std::uint64_t weight,
                                              std::uint32_t now,
                                              std::uint64_t total_power ) const
{
  auto type = to_vote_type( support );
  if( !type )
    return std::unexpected( type.error() );

  auto s = _governor.state( r, proposal_index, now, total_power );
  if( !s )
    return std::unexpected( s.error() );

  if( *s != proposal_state::active )
    return std::unexpected( governance_errc::proposal_not_active );

  if( has_voted( r, proposal_index, voter ) )
    return std::unexpected( governance_errc::already_voted );

  auto count = vote_count( r, proposal_index );
  if( count >= max_vote_records )
    return std::unexpected( governance_errc::capacity_exceeded );

  std::string_view suffix;
  switch( *type )
  {
    case vote_type::against:
      suffix = field::against;
      break;
    case vote_type::in_favor:
      suffix = field::for_votes;
      break;
    case vote_type::abstain:
      suffix = field::abstain;
      break;
  }

  auto tally_key = record::key::proposal( proposal_index, suffix );
  auto current   = record::read_number< std::uint64_t >( r, tally_key ).value_or( 0 );

  auto updated_tally = checked_add( current, weight );
  if( !updated_tally )
    return std::unexpected( governance_errc::overflow );

  auto tally_value = encode::to_decimal( *updated_tally );
  auto vote_key    = record::key::vote( proposal_index, static_cast< std::uint8_t >( count ) );
  auto vote_value  = format_vote( vote_record{ .voter = voter, .support = *type, .weight = weight } );

  const std::array< record::entry, 2 > fields{
    record::entry{ .key = tally_key, .value = tally_value },
    record::entry{ .key = vote_key, .value = vote_value }
  };

  return r.rewrite( fields );
}

tally counting::proposal_votes( const record::record& r, std::uint8_t proposal_index ) const
{
  auto tally_of = [ & ]( std::string_view suffix )
  {
    return record::read_number< std::uint64_t >( r, record::key::proposal( proposal_index, suffix ) ).value_or( 0 );
  };

  return tally{
    .for_votes     = tally_of( field::for_votes ),
    .against_votes = tally_of( field::against ),
    .abstain_votes = tally_of( field::abstain )
  };
}

bool counting::quorum_reached( const record::record& r, std::uint8_t proposal_index, std::uint64_t total_power ) const
{
  auto t = proposal_votes( r, proposal_index );
  return saturating_add( t.for_votes, t.abstain_votes ) >= quorum( total_power, _settings.quorum_percentage );
}

bool counting::vote_succeeded( const record::record& r, std::uint8_t proposal_index ) const
{
  auto t = proposal_votes( r, proposal_index );
  return t.for_votes > t.against_votes;
}

} // namespace comitia::governance
