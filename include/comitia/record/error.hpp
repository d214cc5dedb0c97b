#pragma once

#include <expected>
#include <system_error>

namespace comitia::record {

enum class record_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  capacity_exceeded,
  missing_entry,
  invalid_key,
  invalid_value
};

const std::error_category& record_category() noexcept;

std::error_code make_error_code( record_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace comitia::record

template<>
struct std::is_error_code_enum< comitia::record::record_errc >: public std::true_type
{};
