#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <comitia/governance/counting.hpp>
#include <comitia/governance/delegation.hpp>
#include <comitia/governance/governor.hpp>
#include <comitia/governance/membership.hpp>
#include <comitia/governance/settings.hpp>
#include <comitia/program/error.hpp>
#include <comitia/program/program.hpp>
#include <comitia/record/record.hpp>

namespace comitia::program {

/**
 * The governance program. Each run reads a little endian instruction from
 * stdin followed by its arguments, applies the matching action to the record
 * held by the host and writes any result to stdout.
 */
struct dao final: public program
{
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    propose,
    cast_vote,
    queue,
    execute,
    cancel,
    delegate,
    self_register,
    set_member,
    grant_role,
    revoke_role,
    cast_vote_by_signature,
    snapshot,
    proposal_state,
    get_votes
  };

  static constexpr std::uint32_t description_hash_multiplier = 0x9E37'79B9;

  explicit dao( const governance::settings& s );
  dao( const dao& ) = delete;
  dao( dao&& )      = delete;
  ~dao() override   = default;

  dao& operator=( const dao& ) = delete;
  dao& operator=( dao&& )      = delete;

  std::error_code run( system_interface* system ) override;

  static std::optional< instruction > instruction_from_string( std::string_view name ) noexcept;
  static std::string_view to_string( instruction i ) noexcept;

private:
  std::error_code dispatch( system_interface* system, instruction i );

  std::error_code propose( system_interface* system );
  std::error_code cast_vote( system_interface* system );
  std::error_code queue( system_interface* system );
  std::error_code execute( system_interface* system );
  std::error_code cancel( system_interface* system );
  std::error_code delegate( system_interface* system );
  std::error_code self_register( system_interface* system );
  std::error_code set_member( system_interface* system );
  std::error_code change_role( system_interface* system, bool grant );
  std::error_code cast_vote_by_signature( system_interface* system );
  std::error_code snapshot( system_interface* system );
  std::error_code proposal_state( system_interface* system );
  std::error_code get_votes( system_interface* system );

  result< record::record > load( system_interface* system ) const;
  result< record::record > load_unlocked( system_interface* system ) const;
  std::error_code store( system_interface* system, const record::record& r ) const;
  result< protocol::account > verified_caller( system_interface* system ) const;
  std::error_code require_admin( const record::record& r, const protocol::account& caller ) const;

  governance::settings _settings;
  governance::membership _membership;
  governance::delegation _delegation;
  governance::governor _governor;
  governance::counting _counting;
};

} // namespace comitia::program
