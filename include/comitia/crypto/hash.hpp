#pragma once

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include <comitia/protocol/account.hpp>

namespace comitia::crypto {

/**
 * Deterministic, order sensitive 64-bit mixer: an FNV-1a accumulator followed
 * by the MurmurHash3 64-bit finalizer. Not a cryptographic hash.
 */
class mixer final
{
public:
  static constexpr std::uint64_t offset_basis = 0xcbf2'9ce4'8422'2325ull;
  static constexpr std::uint64_t prime        = 0x0000'0100'0000'01b3ull;

  void update( std::span< const std::byte > bytes ) noexcept;
  void update( std::string_view sv ) noexcept;

  // Integers are mixed most significant byte first.
  template< std::unsigned_integral T >
  void update( T t ) noexcept
  {
    if constexpr( sizeof( T ) > 1 && std::endian::native == std::endian::little )
      t = std::byteswap( t );

    update( std::as_bytes( std::span( &t, 1 ) ) );
  }

  std::uint64_t finalize() const noexcept;

private:
  std::uint64_t _state = offset_basis;
};

std::uint32_t
proposal_id( const protocol::account& proposer, std::uint32_t description_hash, std::uint32_t now, std::uint8_t nonce ) noexcept;

std::uint32_t operation_id( std::uint32_t proposal_id, std::uint32_t schedule_time, std::uint8_t nonce ) noexcept;

// Unlike the identifiers above, the low bit is not forced.
std::uint32_t message_hash( std::string_view message ) noexcept;

} // namespace comitia::crypto
