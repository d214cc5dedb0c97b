#include <comitia/governance/signatures.hpp>

#include <comitia/crypto.hpp>
#include <comitia/encode/decimal.hpp>
#include <comitia/governance/types.hpp>
#include <comitia/record/key.hpp>

#include <utility>

namespace comitia::governance {

std::string build_vote_message( std::uint32_t proposal_id, std::uint8_t support, const protocol::account& voter )
{
  std::string message( vote_message_prefix );
  message += encode::to_decimal( proposal_id );
  message.push_back( ':' );
  message += encode::to_decimal( support );
  message.push_back( ':' );
  message += protocol::to_hex( voter );
  return message;
}

std::uint32_t vote_message_hash( std::string_view message ) noexcept
{
  return crypto::message_hash( message );
}

bool validate_vote_message( std::uint32_t proposal_id, std::uint8_t support, const protocol::account& voter ) noexcept
{
  return support <= std::to_underlying( vote_type::abstain ) && proposal_id != 0 && !protocol::is_null( voter );
}

result< record::record > record_vote_intent( const record::record& r,
                                             std::uint32_t proposal_id,
                                             std::uint8_t support,
                                             const protocol::account& voter )
{
  if( !validate_vote_message( proposal_id, support, voter ) )
    return std::unexpected( governance_errc::invalid_vote );

  auto key = record::key::signature_vote( proposal_id, voter );
  if( r.contains( key ) )
    return std::unexpected( governance_errc::already_voted );

  return r.append_entry( key, encode::to_decimal( support ) );
}

} // namespace comitia::governance
