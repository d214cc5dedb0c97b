#include <comitia/record/key.hpp>

#include <comitia/encode/decimal.hpp>

namespace comitia::record::key {

constexpr std::uint8_t decimal_base = 10;
constexpr std::uint8_t hundred      = 100;

std::string index( std::uint8_t i )
{
  std::string out;

  if( i >= hundred )
    out.push_back( static_cast< char >( '0' + i / hundred ) );
  if( i >= decimal_base )
    out.push_back( static_cast< char >( '0' + i / decimal_base % decimal_base ) );
  out.push_back( static_cast< char >( '0' + i % decimal_base ) );

  return out;
}

result< std::uint8_t > parse_index( std::string_view sv ) noexcept
{
  if( sv.empty() || sv.size() > 3 || ( sv.size() > 1 && sv.front() == '0' ) )
    return std::unexpected( record_errc::invalid_key );

  auto value = encode::from_decimal< std::uint8_t >( sv );
  if( !value )
    return std::unexpected( record_errc::invalid_key );

  return *value;
}

std::string indexed( std::string_view prefix, std::uint8_t i, std::string_view suffix )
{
  std::string out( prefix );
  out += index( i );
  out += suffix;
  return out;
}

std::string member( std::uint8_t i )
{
  return indexed( "member_", i );
}

std::string proposal( std::uint8_t i, std::string_view field )
{
  return indexed( "prop_", i, field );
}

std::string vote( std::uint8_t proposal_index, std::uint8_t vote_index )
{
  return indexed( "vote_", proposal_index, "_" ) + index( vote_index );
}

std::string operation( std::uint8_t i, std::string_view field )
{
  return indexed( "op_", i, field );
}

std::string delegate( const protocol::account& voter )
{
  return "delegate_" + protocol::to_hex( voter );
}

std::string snapshot( std::uint32_t proposal_id, const protocol::account& account )
{
  return "snap_" + encode::to_decimal( proposal_id ) + "_" + protocol::to_hex( account );
}

std::string signature_vote( std::uint32_t proposal_id, const protocol::account& voter )
{
  return "sigvote_" + encode::to_decimal( proposal_id ) + "_" + protocol::to_hex( voter );
}

} // namespace comitia::record::key
