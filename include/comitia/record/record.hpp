#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <comitia/encode/decimal.hpp>
#include <comitia/record/error.hpp>

namespace comitia::record {

constexpr std::size_t default_capacity = 4'096;
constexpr char entry_delimiter         = ';';
constexpr char key_separator           = '=';

struct entry
{
  std::string_view key;
  std::string_view value;
};

/**
 * The ledger record: a flat sequence of key=value entries bounded by a fixed
 * capacity. A record is an immutable value; every mutation produces a new
 * record rebuilt from the whole of the old one, or an error. Entries that a
 * mutation matches are rewritten at their scan position, all others are copied
 * verbatim and unmatched assignments are appended.
 */
class record final
{
public:
  record() = default;
  explicit record( std::size_t capacity ) noexcept;

  static result< record > parse( std::string_view text, std::size_t capacity = default_capacity ) noexcept;

  std::optional< std::string_view > find( std::string_view key ) const noexcept;
  bool contains( std::string_view key ) const noexcept;

  // Replaces the entry if present, appends it otherwise.
  result< record > rewrite( std::string_view key, std::string_view value ) const;
  result< record > rewrite( std::span< const entry > fields ) const;

  // Replaces the entry, failing with missing_entry if it is absent.
  result< record > update( std::string_view key, std::string_view value ) const;

  // Appends without looking for an existing entry of the same key.
  result< record > append_entry( std::string_view key, std::string_view value ) const;

  result< record > erase( std::string_view key ) const;

  std::vector< entry > entries() const;

  std::string_view data() const noexcept;
  std::size_t size() const noexcept;
  std::size_t capacity() const noexcept;
  bool empty() const noexcept;

  bool operator==( const record& ) const = default;

private:
  friend class builder;

  record( std::string data, std::size_t capacity ) noexcept;

  std::string _data;
  std::size_t _capacity = default_capacity;
};

/**
 * Writes a record into a second buffer of the same capacity. A write that
 * does not fit, or a key or value containing a reserved byte, poisons the
 * builder and finish() reports the first such error.
 */
class builder final
{
public:
  explicit builder( std::size_t capacity );

  void append_entry( std::string_view key, std::string_view value );
  void append_separator();
  void append_raw( std::string_view text );

  bool empty() const noexcept;

  result< record > finish() &&;

private:
  void fail( record_errc e ) noexcept;
  bool fits( std::size_t length ) const noexcept;

  std::string _buffer;
  std::size_t _capacity;
  record_errc _error = record_errc::ok;
};

template< std::unsigned_integral T >
std::optional< T > read_number( const record& r, std::string_view key ) noexcept
{
  auto value = r.find( key );
  if( !value )
    return std::nullopt;

  auto number = encode::from_decimal< T >( *value );
  if( !number )
    return std::nullopt;

  return *number;
}

// Missing or malformed counts read as zero.
std::uint8_t read_count( const record& r, std::string_view key ) noexcept;

} // namespace comitia::record
