#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include <comitia/encode/error.hpp>

namespace comitia::protocol {

constexpr std::size_t account_length     = 20;
constexpr std::size_t account_hex_length = account_length * 2;

using account = std::array< std::byte, account_length >;

std::string to_hex( const account& a ) noexcept;
encode::result< account > account_from_hex( std::string_view sv ) noexcept;

bool is_null( const account& a ) noexcept;

} // namespace comitia::protocol
