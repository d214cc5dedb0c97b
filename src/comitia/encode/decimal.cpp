#include <comitia/encode/decimal.hpp>

#include <array>
#include <limits>

namespace comitia::encode {

std::string to_decimal( std::uint64_t value ) noexcept
{
  std::array< char, std::numeric_limits< std::uint64_t >::digits10 + 1 > buffer{};
  auto conversion = std::to_chars( buffer.data(), buffer.data() + buffer.size(), value );
  return std::string( buffer.data(), conversion.ptr );
}

} // namespace comitia::encode
