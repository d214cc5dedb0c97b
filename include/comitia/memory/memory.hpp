#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <span>
#include <type_traits>

namespace comitia::memory {

template< typename T, std::size_t N >
  requires( std::is_trivially_copyable_v< T > )
inline std::span< const std::byte > as_bytes( const std::array< T, N >& a )
{
  return std::as_bytes( std::span< const T >( a.data(), a.size() ) );
}

template< typename T >
  requires( std::is_trivially_copyable_v< T > && std::is_arithmetic_v< T > )
inline std::span< const std::byte > as_bytes( const T& t )
{
  return std::as_bytes( std::span( std::addressof( t ), 1 ) );
}

template< typename T, std::size_t N >
  requires( std::is_trivially_copyable_v< T > )
inline std::span< std::byte > as_writable_bytes( std::array< T, N >& a )
{
  return std::as_writable_bytes( std::span< T >( a.data(), a.size() ) );
}

template< typename T >
  requires( std::is_trivially_copyable_v< T > && std::is_arithmetic_v< T > )
inline std::span< std::byte > as_writable_bytes( T& t )
{
  return std::as_writable_bytes( std::span( std::addressof( t ), 1 ) );
}

} // namespace comitia::memory
