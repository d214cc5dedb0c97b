#pragma once

#include <cstdint>
#include <expected>
#include <system_error>

namespace comitia::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok,
  invalid_instruction,
  invalid_argument
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

constexpr std::int32_t success_code = 1;

/**
 * Signed result code reported to the host. Success is +1 and a governance
 * error is its negated value. Record capacity failures report the governance
 * capacity code; any other failure reports a data read error.
 */
std::int32_t exit_code( std::error_code ec ) noexcept;

} // namespace comitia::program

template<>
struct std::is_error_code_enum< comitia::program::program_errc >: public std::true_type
{};
