#include <comitia/program/dao.hpp>

#include <array>
#include <type_traits>
#include <utility>

#include <boost/endian.hpp>

#include <comitia/governance/signatures.hpp>
#include <comitia/log.hpp>
#include <comitia/memory.hpp>
#include <comitia/program/execution_guard.hpp>

namespace comitia::program {

using governance::governance_errc;

namespace {

constexpr std::array< std::pair< std::string_view, dao::instruction >, 14 > instruction_names{
  {
   { "propose", dao::instruction::propose },
   { "cast_vote", dao::instruction::cast_vote },
   { "queue", dao::instruction::queue },
   { "execute", dao::instruction::execute },
   { "cancel", dao::instruction::cancel },
   { "delegate", dao::instruction::delegate },
   { "self_register", dao::instruction::self_register },
   { "set_member", dao::instruction::set_member },
   { "grant_role", dao::instruction::grant_role },
   { "revoke_role", dao::instruction::revoke_role },
   { "cast_vote_by_signature", dao::instruction::cast_vote_by_signature },
   { "snapshot", dao::instruction::snapshot },
   { "proposal_state", dao::instruction::proposal_state },
   { "get_votes", dao::instruction::get_votes },
   }
};

template< typename T >
  requires std::is_arithmetic_v< T >
std::error_code read_argument( system_interface* system, T& t )
{
  if( auto ec = system->read( file_descriptor::stdin, memory::as_writable_bytes( t ) ); ec )
    return program_errc::invalid_argument;

  boost::endian::little_to_native_inplace( t );
  return {};
}

std::error_code read_argument( system_interface* system, protocol::account& account )
{
  if( auto ec = system->read( file_descriptor::stdin, memory::as_writable_bytes( account ) ); ec )
    return program_errc::invalid_argument;

  return {};
}

template< typename T >
  requires std::is_arithmetic_v< T >
std::error_code write_result( system_interface* system, T t )
{
  boost::endian::native_to_little_inplace( t );
  return system->write( file_descriptor::stdout, memory::as_bytes( t ) );
}

} // namespace

dao::dao( const governance::settings& s ):
    _settings( s ),
    _membership( s ),
    _delegation( s ),
    _governor( s ),
    _counting( s )
{}

std::optional< dao::instruction > dao::instruction_from_string( std::string_view name ) noexcept
{
  for( const auto& [ text, i ]: instruction_names )
  {
    if( text == name )
      return i;
  }

  return std::nullopt;
}

std::string_view dao::to_string( instruction i ) noexcept
{
  for( const auto& [ text, value ]: instruction_names )
  {
    if( value == i )
      return text;
  }

  std::unreachable();
}

std::error_code dao::run( system_interface* system )
{
  std::uint32_t code = 0;
  if( auto ec = read_argument( system, code ); ec )
    return program_errc::invalid_instruction;

  if( code > std::to_underlying( instruction::get_votes ) )
  {
    LOG_WARNING( log::instance(), "Rejected unknown instruction {}", code );
    return program_errc::invalid_instruction;
  }

  auto i  = static_cast< instruction >( code );
  auto ec = dispatch( system, i );

  if( ec )
    LOG_WARNING( log::instance(), "Rejected {}: {}", to_string( i ), ec.message() );
  else
    LOG_INFO( log::instance(), "Accepted {}", to_string( i ) );

  return ec;
}

std::error_code dao::dispatch( system_interface* system, instruction i )
{
  switch( i )
  {
    case instruction::propose:
      return propose( system );
    case instruction::cast_vote:
      return cast_vote( system );
    case instruction::queue:
      return queue( system );
    case instruction::execute:
      return execute( system );
    case instruction::cancel:
      return cancel( system );
    case instruction::delegate:
      return delegate( system );
    case instruction::self_register:
      return self_register( system );
    case instruction::set_member:
      return set_member( system );
    case instruction::grant_role:
      return change_role( system, true );
    case instruction::revoke_role:
      return change_role( system, false );
    case instruction::cast_vote_by_signature:
      return cast_vote_by_signature( system );
    case instruction::snapshot:
      return snapshot( system );
    case instruction::proposal_state:
      return proposal_state( system );
    case instruction::get_votes:
      return get_votes( system );
  }
  std::unreachable();
}

result< record::record > dao::load( system_interface* system ) const
{
  auto text = system->read_record();
  if( !text )
    return std::unexpected( governance_errc::data_read );

  auto r = record::record::parse( *text, _settings.record_capacity );
  if( !r )
    return std::unexpected( governance_errc::data_read );

  return r;
}

result< record::record > dao::load_unlocked( system_interface* system ) const
{
  auto r = load( system );
  if( !r )
    return r;

  // Writes made while an execution holds the lock would be overwritten when it commits.
  if( _governor.is_locked( *r ) )
    return std::unexpected( governance_errc::reentrant );

  return r;
}

std::error_code dao::store( system_interface* system, const record::record& r ) const
{
  if( auto ec = system->write_record( r.data() ); ec )
  {
    LOG_ERROR( log::instance(), "Unable to write record: {}", ec.message() );
    return governance_errc::host_call;
  }

  return {};
}

result< protocol::account > dao::verified_caller( system_interface* system ) const
{
  auto caller = system->get_caller();
  if( !caller )
    return std::unexpected( governance_errc::host_call );

  auto verify = system->get_caller();
  if( !verify )
    return std::unexpected( governance_errc::host_call );

  if( *caller != *verify )
    return std::unexpected( governance_errc::caller_verification );

  return caller;
}

std::error_code dao::require_admin( const record::record& r, const protocol::account& caller ) const
{
  // The first member of an empty ledger is installed by whoever creates it.
  if( _membership.member_count( r ) == 0 )
    return {};

  if( !_membership.has_role( r, caller, governance::role::admin ) )
    return governance_errc::not_admin;

  return {};
}

std::error_code dao::propose( system_interface* system )
{
  std::uint32_t description_hash = 0;
  if( auto ec = read_argument( system, description_hash ); ec )
    return ec;

  auto caller = verified_caller( system );
  if( !caller )
    return caller.error();

  auto r = load_unlocked( system );
  if( !r )
    return r.error();

  auto now = system->get_time();
  if( description_hash == 0 )
    description_hash = now * description_hash_multiplier;

  auto receipt = _governor.propose( *r, *caller, description_hash, now, _delegation.effective_votes( *r, *caller ) );
  if( !receipt )
    return receipt.error();

  if( auto ec = store( system, receipt->ledger ); ec )
    return ec;

  LOG_DEBUG( log::instance(),
             "Proposal {} created at index {} by {}",
             receipt->proposal_id,
             receipt->index,
             log::account{ *caller } );

  return write_result( system, receipt->proposal_id );
}

std::error_code dao::cast_vote( system_interface* system )
{
  std::uint32_t proposal_id = 0;
  std::uint8_t support      = 0;

  if( auto ec = read_argument( system, proposal_id ); ec )
    return ec;

  if( auto ec = read_argument( system, support ); ec )
    return ec;

  auto caller = verified_caller( system );
  if( !caller )
    return caller.error();

  auto r = load_unlocked( system );
  if( !r )
    return r.error();

  auto index = _governor.find_by_id( *r, proposal_id );
  if( !index )
    return index.error();

  auto weight = _delegation.effective_votes( *r, *caller );
  auto voted  = _counting.cast_vote( *r,
                                    *index,
                                    *caller,
                                    support,
                                    weight,
                                    system->get_time(),
                                    _membership.total_voting_power( *r ) );
  if( !voted )
    return voted.error();

  LOG_DEBUG( log::instance(), "{} voted {} with weight {} on {}", log::account{ *caller }, support, weight, proposal_id );

  return store( system, *voted );
}

std::error_code dao::queue( system_interface* system )
{
  std::uint32_t proposal_id = 0;
  if( auto ec = read_argument( system, proposal_id ); ec )
    return ec;

  auto r = load_unlocked( system );
  if( !r )
    return r.error();

  auto index = _governor.find_by_id( *r, proposal_id );
  if( !index )
    return index.error();

  auto receipt = _governor.queue( *r, *index, system->get_time(), _membership.total_voting_power( *r ) );
  if( !receipt )
    return receipt.error();

  if( auto ec = store( system, receipt->ledger ); ec )
    return ec;

  return write_result( system, receipt->operation_id );
}

std::error_code dao::execute( system_interface* system )
{
  std::uint32_t proposal_id = 0;
  if( auto ec = read_argument( system, proposal_id ); ec )
    return ec;

  auto caller = verified_caller( system );
  if( !caller )
    return caller.error();

  auto r = load_unlocked( system );
  if( !r )
    return r.error();

  if( !_membership.has_role( *r, *caller, governance::role::executor ) )
    return governance_errc::not_executor;

  auto index = _governor.find_by_id( *r, proposal_id );
  if( !index )
    return index.error();

  execution_guard guard( system, _governor );
  if( auto ec = guard.acquire( *r ); ec )
    return ec;

  auto executed = _governor.execute( guard.locked(), *index, system->get_time() );
  if( !executed )
    return executed.error();

  const auto& timelock = _governor.timelock().timelock();

  auto operation_index = timelock.find_by_proposal( *executed, proposal_id );
  if( !operation_index )
    return operation_index.error();

  auto operation = timelock.get_operation( *executed, *operation_index );
  if( !operation )
    return operation.error();

  if( auto ec = system->notify_execution( proposal_id, operation->id ); ec )
  {
    LOG_ERROR( log::instance(), "Host rejected execution of proposal {}: {}", proposal_id, ec.message() );
    return governance_errc::host_call;
  }

  return guard.commit( *executed );
}

std::error_code dao::cancel( system_interface* system )
{
  std::uint32_t proposal_id = 0;
  if( auto ec = read_argument( system, proposal_id ); ec )
    return ec;

  auto caller = verified_caller( system );
  if( !caller )
    return caller.error();

  auto r = load_unlocked( system );
  if( !r )
    return r.error();

  auto index = _governor.find_by_id( *r, proposal_id );
  if( !index )
    return index.error();

  auto canceled =
    _governor.cancel( *r, *index, *caller, system->get_time(), _membership.total_voting_power( *r ) );
  if( !canceled )
    return canceled.error();

  return store( system, *canceled );
}

std::error_code dao::delegate( system_interface* system )
{
  protocol::account target{};
  if( auto ec = read_argument( system, target ); ec )
    return ec;

  auto caller = verified_caller( system );
  if( !caller )
    return caller.error();

  auto r = load_unlocked( system );
  if( !r )
    return r.error();

  auto delegated = _delegation.delegate( *r, *caller, target );
  if( !delegated )
    return delegated.error();

  LOG_DEBUG( log::instance(), "{} delegated to {}", log::account{ *caller }, log::account{ target } );

  return store( system, *delegated );
}

std::error_code dao::self_register( system_interface* system )
{
  auto caller = verified_caller( system );
  if( !caller )
    return caller.error();

  auto r = load_unlocked( system );
  if( !r )
    return r.error();

  auto registered = _membership.register_member( *r, *caller );
  if( !registered )
    return registered.error();

  if( *registered == *r )
    return {};

  return store( system, *registered );
}

std::error_code dao::set_member( system_interface* system )
{
  protocol::account account{};
  std::uint64_t power = 0;
  std::uint8_t roles  = 0;

  if( auto ec = read_argument( system, account ); ec )
    return ec;

  if( auto ec = read_argument( system, power ); ec )
    return ec;

  if( auto ec = read_argument( system, roles ); ec )
    return ec;

  auto caller = verified_caller( system );
  if( !caller )
    return caller.error();

  auto r = load_unlocked( system );
  if( !r )
    return r.error();

  if( auto ec = require_admin( *r, *caller ); ec )
    return ec;

  auto updated = _membership.set_member( *r, account, power, roles );
  if( !updated )
    return updated.error();

  return store( system, *updated );
}

std::error_code dao::change_role( system_interface* system, bool grant )
{
  protocol::account account{};
  std::uint8_t role = 0;

  if( auto ec = read_argument( system, account ); ec )
    return ec;

  if( auto ec = read_argument( system, role ); ec )
    return ec;

  auto caller = verified_caller( system );
  if( !caller )
    return caller.error();

  auto r = load_unlocked( system );
  if( !r )
    return r.error();

  if( auto ec = require_admin( *r, *caller ); ec )
    return ec;

  auto updated =
    grant ? _membership.grant_role( *r, account, role ) : _membership.revoke_role( *r, account, role );
  if( !updated )
    return updated.error();

  return store( system, *updated );
}

std::error_code dao::cast_vote_by_signature( system_interface* system )
{
  std::uint32_t proposal_id = 0;
  std::uint8_t support      = 0;
  protocol::account voter{};

  if( auto ec = read_argument( system, proposal_id ); ec )
    return ec;

  if( auto ec = read_argument( system, support ); ec )
    return ec;

  if( auto ec = read_argument( system, voter ); ec )
    return ec;

  auto r = load_unlocked( system );
  if( !r )
    return r.error();

  if( auto index = _governor.find_by_id( *r, proposal_id ); !index )
    return index.error();

  auto recorded = governance::record_vote_intent( *r, proposal_id, support, voter );
  if( !recorded )
    return recorded.error();

  LOG_DEBUG( log::instance(),
             "Recorded vote intent {} for {}",
             governance::vote_message_hash( governance::build_vote_message( proposal_id, support, voter ) ),
             log::account{ voter } );

  return store( system, *recorded );
}

std::error_code dao::snapshot( system_interface* system )
{
  std::uint32_t proposal_id = 0;
  protocol::account account{};

  if( auto ec = read_argument( system, proposal_id ); ec )
    return ec;

  if( auto ec = read_argument( system, account ); ec )
    return ec;

  auto r = load_unlocked( system );
  if( !r )
    return r.error();

  if( auto index = _governor.find_by_id( *r, proposal_id ); !index )
    return index.error();

  auto snapped = _delegation.snapshot_voting_power( *r, proposal_id, account );
  if( !snapped )
    return snapped.error();

  if( *snapped != *r )
  {
    if( auto ec = store( system, *snapped ); ec )
      return ec;
  }

  return write_result( system, _delegation.snapshot_votes( *snapped, proposal_id, account ) );
}

std::error_code dao::proposal_state( system_interface* system )
{
  std::uint32_t proposal_id = 0;
  if( auto ec = read_argument( system, proposal_id ); ec )
    return ec;

  auto r = load( system );
  if( !r )
    return r.error();

  auto index = _governor.find_by_id( *r, proposal_id );
  if( !index )
    return index.error();

  auto state = _governor.state( *r, *index, system->get_time(), _membership.total_voting_power( *r ) );
  if( !state )
    return state.error();

  return write_result( system, std::to_underlying( *state ) );
}

std::error_code dao::get_votes( system_interface* system )
{
  protocol::account account{};
  if( auto ec = read_argument( system, account ); ec )
    return ec;

  auto r = load( system );
  if( !r )
    return r.error();

  return write_result( system, _delegation.effective_votes( *r, account ) );
}

} // namespace comitia::program
