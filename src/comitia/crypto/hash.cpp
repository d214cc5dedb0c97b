#include <comitia/crypto/hash.hpp>

namespace comitia::crypto {

constexpr std::uint64_t avalanche_shift = 33;
constexpr std::uint64_t avalanche_c1    = 0xff51'afd7'ed55'8ccdull;
constexpr std::uint64_t avalanche_c2    = 0xc4ce'b9fe'1a85'ec53ull;

void mixer::update( std::span< const std::byte > bytes ) noexcept
{
  for( auto b: bytes )
  {
    _state ^= std::to_integer< std::uint64_t >( b );
    _state *= prime;
  }
}

void mixer::update( std::string_view sv ) noexcept
{
  update( std::as_bytes( std::span( sv ) ) );
}

std::uint64_t mixer::finalize() const noexcept
{
  auto h  = _state;
  h      ^= h >> avalanche_shift;
  h      *= avalanche_c1;
  h      ^= h >> avalanche_shift;
  h      *= avalanche_c2;
  h      ^= h >> avalanche_shift;
  return h;
}

static std::uint32_t identifier( const mixer& m ) noexcept
{
  return static_cast< std::uint32_t >( m.finalize() ) | 1u;
}

std::uint32_t
proposal_id( const protocol::account& proposer, std::uint32_t description_hash, std::uint32_t now, std::uint8_t nonce ) noexcept
{
  mixer m;
  m.update( std::span< const std::byte >( proposer ) );
  m.update( description_hash );
  m.update( now );
  m.update( nonce );
  return identifier( m );
}

std::uint32_t operation_id( std::uint32_t proposal_id, std::uint32_t schedule_time, std::uint8_t nonce ) noexcept
{
  mixer m;
  m.update( proposal_id );
  m.update( schedule_time );
  m.update( nonce );
  return identifier( m );
}

std::uint32_t message_hash( std::string_view message ) noexcept
{
  mixer m;
  m.update( message );
  return static_cast< std::uint32_t >( m.finalize() );
}

} // namespace comitia::crypto
