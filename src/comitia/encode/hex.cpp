#include <comitia/encode/hex.hpp>

#include <algorithm>
#include <bit>
#include <cstdint>

namespace comitia::encode {

constexpr char hex_offset = 10;
constexpr std::string_view hex_digits = "0123456789abcdef";

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string out;
  out.reserve( s.size() * 2 );

  for( const auto& b: s )
  {
    auto c = std::bit_cast< unsigned char >( b );
    out.push_back( hex_digits[ c >> 4 ] );
    out.push_back( hex_digits[ c & 0x0f ] );
  }

  return out;
}

result< std::uint8_t > hex_to_char( char in ) noexcept
{
  if( in >= '0' && in <= '9' )
    return in - '0';
  if( in >= 'a' && in <= 'f' )
    return in - 'a' + hex_offset;
  if( in >= 'A' && in <= 'F' )
    return in - 'A' + hex_offset;

  return std::unexpected( encode_errc::invalid_character );
}

static std::string_view strip_prefix( std::string_view sv ) noexcept
{
  if( sv.size() >= 2 && sv[ 0 ] == '0' && ( sv[ 1 ] == 'x' || sv[ 1 ] == 'X' ) )
    sv.remove_prefix( 2 );
  return sv;
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  sv = strip_prefix( sv );

  if( sv.size() % 2 != 0 )
    return std::unexpected( encode_errc::invalid_length );

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() / 2 );

  for( std::size_t i = 0; i < sv.size(); i += 2 )
  {
    if( auto first_char = hex_to_char( sv[ i ] ); first_char )
    {
      if( auto second_char = hex_to_char( sv[ i + 1 ] ); second_char )
        bytes.push_back( static_cast< std::byte >( *first_char << 4 | *second_char ) );
      else
        return std::unexpected( second_char.error() );
    }
    else
      return std::unexpected( first_char.error() );
  }

  return bytes;
}

std::error_code from_hex( std::string_view sv, std::span< std::byte > out ) noexcept
{
  auto bytes = from_hex( sv );
  if( !bytes )
    return bytes.error();

  if( bytes->size() != out.size() )
    return encode_errc::invalid_length;

  std::ranges::copy( *bytes, out.begin() );
  return encode_errc::ok;
}

} // namespace comitia::encode
