#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <comitia/encode/error.hpp>

namespace comitia::encode {

// Lowercase, unprefixed. This is the form stored in ledger records.
std::string to_hex( std::span< const std::byte > s ) noexcept;

// Accepts an optional 0x prefix and either case.
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

// Decodes exactly out.size() bytes into out, leaving it untouched on failure.
std::error_code from_hex( std::string_view sv, std::span< std::byte > out ) noexcept;

} // namespace comitia::encode
