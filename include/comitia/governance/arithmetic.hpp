#pragma once

#include <concepts>
#include <limits>
#include <optional>

namespace comitia::governance {

template< std::unsigned_integral T >
constexpr std::optional< T > checked_add( T a, T b ) noexcept
{
  if( std::numeric_limits< T >::max() - a < b )
    return std::nullopt;

  return static_cast< T >( a + b );
}

template< std::unsigned_integral T >
constexpr T saturating_add( T a, T b ) noexcept
{
  return checked_add( a, b ).value_or( std::numeric_limits< T >::max() );
}

template< std::unsigned_integral T >
constexpr T saturating_mul( T a, T b ) noexcept
{
  if( a != 0 && b > std::numeric_limits< T >::max() / a )
    return std::numeric_limits< T >::max();

  return static_cast< T >( a * b );
}

} // namespace comitia::governance
