#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <comitia/governance/error.hpp>
#include <comitia/governance/settings.hpp>
#include <comitia/governance/types.hpp>
#include <comitia/protocol/account.hpp>
#include <comitia/record/record.hpp>

namespace comitia::governance {

constexpr char member_field_separator = ':';

// Member values are stored as <40-hex-account>:<power>:<roles>.
std::string format_member( const member& m );
result< member > parse_member( std::string_view value ) noexcept;

// Whole percent of the total power, clamped on overflow.
std::uint64_t quorum( std::uint64_t total_voting_power, std::uint8_t percentage ) noexcept;

class membership final
{
public:
  explicit membership( const settings& s ) noexcept;

  std::optional< member > find_member( const record::record& r, const protocol::account& account ) const;
  std::vector< member > members( const record::record& r ) const;
  std::uint8_t member_count( const record::record& r ) const noexcept;

  std::uint64_t get_votes( const record::record& r, const protocol::account& account ) const;
  std::uint8_t get_roles( const record::record& r, const protocol::account& account ) const;
  bool has_role( const record::record& r, const protocol::account& account, std::uint8_t role ) const;

  // Clamps at the maximum representable power.
  std::uint64_t total_voting_power( const record::record& r ) const;
  std::uint64_t quorum( std::uint64_t total_voting_power ) const noexcept;

  result< record::record >
  set_member( const record::record& r, const protocol::account& account, std::uint64_t power, std::uint8_t roles ) const;

  result< record::record > grant_role( const record::record& r, const protocol::account& account, std::uint8_t role ) const;
  result< record::record > revoke_role( const record::record& r, const protocol::account& account, std::uint8_t role ) const;

  // Registering an existing member is a no-op.
  result< record::record > register_member( const record::record& r, const protocol::account& account ) const;

private:
  struct located
  {
    std::uint8_t index;
    member value;
  };

  std::optional< located > locate( const record::record& r, const protocol::account& account ) const;

  settings _settings;
};

} // namespace comitia::governance
