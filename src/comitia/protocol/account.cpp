#include <comitia/protocol/account.hpp>

#include <algorithm>

#include <comitia/encode/hex.hpp>

namespace comitia::protocol {

std::string to_hex( const account& a ) noexcept
{
  return encode::to_hex( a );
}

encode::result< account > account_from_hex( std::string_view sv ) noexcept
{
  account a{};
  if( auto error = encode::from_hex( sv, a ); error )
    return std::unexpected( error );

  return a;
}

bool is_null( const account& a ) noexcept
{
  return std::ranges::all_of( a,
                              []( std::byte b )
                              {
                                return b == std::byte{ 0x00 };
                              } );
}

} // namespace comitia::protocol
