#pragma once

#include <charconv>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>

#include <comitia/encode/error.hpp>

namespace comitia::encode {

std::string to_decimal( std::uint64_t value ) noexcept;

template< std::unsigned_integral T >
result< T > from_decimal( std::string_view sv ) noexcept
{
  if( sv.empty() )
    return std::unexpected( encode_errc::invalid_length );

  for( auto c: sv )
  {
    if( c < '0' || c > '9' )
      return std::unexpected( encode_errc::invalid_character );
  }

  T value{};
  auto [ ptr, ec ] = std::from_chars( sv.data(), sv.data() + sv.size(), value );

  if( ec == std::errc::result_out_of_range )
    return std::unexpected( encode_errc::out_of_range );

  if( ec != std::errc{} || ptr != sv.data() + sv.size() )
    return std::unexpected( encode_errc::invalid_character );

  return value;
}

} // namespace comitia::encode
