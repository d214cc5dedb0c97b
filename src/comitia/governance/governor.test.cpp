// NOLINTBEGIN

#include <gtest/gtest.h>

#include <limits>

#include <comitia/governance/counting.hpp>
#include <comitia/governance/governor.hpp>
#include <test/fixture.hpp>

using comitia::governance::governance_errc;
using comitia::governance::proposal_state;

constexpr std::uint64_t total_power = 300'000'000;

class governor: public ::testing::Test
{
public:
  governor():
      alice( test::make_test_account( 1 ) ),
      bob( test::make_test_account( 2 ) ),
      g( s ),
      c( s )
  {}

  comitia::governance::proposal_receipt propose( std::uint32_t now = 1'000 )
  {
    auto receipt = g.propose( ledger, alice, 42, now, 200'000'000 );
    if( !receipt )
    {
      ADD_FAILURE() << receipt.error().message();
      return {};
    }

    ledger = receipt->ledger;
    return *receipt;
  }

  comitia::governance::settings s;
  comitia::protocol::account alice;
  comitia::protocol::account bob;
  comitia::governance::governor g;
  comitia::governance::counting c;
  comitia::record::record ledger;
};

TEST_F( governor, propose )
{
  auto receipt = propose();

  EXPECT_EQ( receipt.index, 0 );
  EXPECT_NE( receipt.proposal_id, 0u );
  EXPECT_EQ( g.proposal_count( ledger ), 1 );

  auto p = g.get_proposal( ledger, 0 );
  ASSERT_TRUE( p );
  EXPECT_EQ( p->id, receipt.proposal_id );
  EXPECT_EQ( p->proposer, alice );
  EXPECT_EQ( p->vote_start, 1'300u );
  EXPECT_EQ( p->vote_end, 260'500u );
  EXPECT_EQ( p->stored_state, proposal_state::pending );
  EXPECT_EQ( p->for_votes, 0u );
  EXPECT_EQ( p->description_hash, 42u );

  EXPECT_EQ( g.state( ledger, 0, 1'000, total_power ), proposal_state::pending );
  EXPECT_EQ( g.state( ledger, 0, 1'300, total_power ), proposal_state::active );
  EXPECT_EQ( g.state( ledger, 0, 5'000, total_power ), proposal_state::active );
  EXPECT_EQ( g.state( ledger, 0, 260'500, total_power ), proposal_state::active );

  auto second = propose();
  EXPECT_EQ( second.index, 1 );
  EXPECT_NE( second.proposal_id, receipt.proposal_id );
  EXPECT_EQ( g.find_by_id( ledger, second.proposal_id ), 1 );
  EXPECT_EQ( g.find_by_id( ledger, receipt.proposal_id ), 0 );
}

TEST_F( governor, propose_errors )
{
  auto receipt = g.propose( ledger, alice, 42, 1'000, s.proposal_threshold - 1 );
  ASSERT_FALSE( receipt );
  EXPECT_EQ( receipt.error(), governance_errc::below_threshold );

  receipt = g.propose( ledger, alice, 42, std::numeric_limits< std::uint32_t >::max() - 100, 200'000'000 );
  ASSERT_FALSE( receipt );
  EXPECT_EQ( receipt.error(), governance_errc::overflow );

  for( std::size_t i = 0; i < s.max_proposals; ++i )
    propose( 1'000 + std::uint32_t( i ) );

  receipt = g.propose( ledger, alice, 42, 2'000, 200'000'000 );
  ASSERT_FALSE( receipt );
  EXPECT_EQ( receipt.error(), governance_errc::max_proposals_reached );
}

TEST_F( governor, unknown_proposal )
{
  auto p = g.get_proposal( ledger, 0 );
  ASSERT_FALSE( p );
  EXPECT_EQ( p.error(), governance_errc::proposal_not_found );

  auto state = g.state( ledger, 3, 1'000, total_power );
  ASSERT_FALSE( state );
  EXPECT_EQ( state.error(), governance_errc::proposal_not_found );

  auto index = g.find_by_id( ledger, 1 );
  ASSERT_FALSE( index );
  EXPECT_EQ( index.error(), governance_errc::proposal_not_found );
}

TEST_F( governor, malformed_proposal )
{
  propose();

  auto corrupted = ledger.rewrite( "prop_0_state", "9" );
  ASSERT_TRUE( corrupted );

  auto p = g.get_proposal( *corrupted, 0 );
  ASSERT_FALSE( p );
  EXPECT_EQ( p.error(), governance_errc::data_read );
}

TEST_F( governor, outcome )
{
  auto receipt = propose();
  constexpr std::uint32_t closed = 260'501;

  EXPECT_EQ( g.state( ledger, 0, closed, total_power ), proposal_state::defeated );

  auto voted = c.cast_vote( ledger, 0, bob, 1, 100'000'000, 5'000, total_power );
  ASSERT_TRUE( voted );
  EXPECT_EQ( g.state( *voted, 0, closed, total_power ), proposal_state::succeeded );

  auto tied = c.cast_vote( *voted, 0, alice, 0, 100'000'000, 5'000, total_power );
  ASSERT_TRUE( tied );
  EXPECT_EQ( g.state( *tied, 0, closed, total_power ), proposal_state::defeated );

  // Abstentions count toward quorum but not toward the outcome.
  auto abstained = c.cast_vote( ledger, 0, alice, 2, 12'000'000, 5'000, total_power );
  ASSERT_TRUE( abstained );
  EXPECT_EQ( g.state( *abstained, 0, closed, total_power ), proposal_state::defeated );

  auto small_for = c.cast_vote( *abstained, 0, bob, 1, 1, 5'000, total_power );
  ASSERT_TRUE( small_for );
  EXPECT_EQ( g.state( *small_for, 0, closed, total_power ), proposal_state::succeeded );

  EXPECT_EQ( receipt.index, 0 );
}

TEST_F( governor, cancel )
{
  propose();

  auto canceled = g.cancel( ledger, 0, bob, 1'000, total_power );
  ASSERT_FALSE( canceled );
  EXPECT_EQ( canceled.error(), governance_errc::not_proposer );

  canceled = g.cancel( ledger, 0, alice, 5'000, total_power );
  ASSERT_FALSE( canceled );
  EXPECT_EQ( canceled.error(), governance_errc::proposal_not_active );

  canceled = g.cancel( ledger, 0, alice, 1'000, total_power );
  ASSERT_TRUE( canceled );
  EXPECT_EQ( g.state( *canceled, 0, 300'000, total_power ), proposal_state::canceled );

  auto again = g.cancel( *canceled, 0, alice, 1'000, total_power );
  ASSERT_FALSE( again );
  EXPECT_EQ( again.error(), governance_errc::proposal_not_active );
}

TEST_F( governor, lock )
{
  EXPECT_FALSE( g.is_locked( ledger ) );

  auto locked = g.set_lock( ledger, true );
  ASSERT_TRUE( locked );
  EXPECT_TRUE( g.is_locked( *locked ) );

  auto relocked = g.set_lock( *locked, true );
  ASSERT_TRUE( relocked );
  EXPECT_EQ( *relocked, *locked );

  auto unlocked = g.set_lock( *locked, false );
  ASSERT_TRUE( unlocked );
  EXPECT_FALSE( g.is_locked( *unlocked ) );
  EXPECT_EQ( unlocked->find( "_lock" ), "0" );

  // Toggling the lock leaves every other entry untouched.
  propose();
  auto voted = c.cast_vote( ledger, 0, alice, 1, 200'000'000, 5'000, total_power );
  ASSERT_TRUE( voted );

  auto held = g.set_lock( *voted, true );
  ASSERT_TRUE( held );
  auto released = g.set_lock( *held, false );
  ASSERT_TRUE( released );

  auto before = voted->erase( "_lock" );
  auto after  = released->erase( "_lock" );
  ASSERT_TRUE( before );
  ASSERT_TRUE( after );
  EXPECT_EQ( *after, *before );
}

TEST_F( governor, queue_and_execute )
{
  auto receipt = propose();
  auto voted = c.cast_vote( ledger, 0, alice, 1, 200'000'000, 5'000, total_power );
  ASSERT_TRUE( voted );
  ledger = *voted;

  auto early = g.queue( ledger, 0, 5'000, total_power );
  ASSERT_FALSE( early );
  EXPECT_EQ( early.error(), governance_errc::proposal_not_active );

  constexpr std::uint32_t closed = 260'501;
  auto queued                    = g.queue( ledger, 0, closed, total_power );
  ASSERT_TRUE( queued );
  EXPECT_EQ( g.state( queued->ledger, 0, closed, total_power ), proposal_state::queued );

  const auto& timelock = g.timelock().timelock();
  auto operation_index = timelock.find_by_proposal( queued->ledger, receipt.proposal_id );
  ASSERT_TRUE( operation_index );
  EXPECT_EQ( timelock.timestamp( queued->ledger, *operation_index ), closed + s.timelock_min_delay );

  auto requeued = g.queue( queued->ledger, 0, closed, total_power );
  ASSERT_FALSE( requeued );
  EXPECT_EQ( requeued.error(), governance_errc::proposal_not_active );

  auto premature = g.execute( queued->ledger, 0, closed );
  ASSERT_FALSE( premature );
  EXPECT_EQ( premature.error(), governance_errc::op_not_ready );

  auto executed = g.execute( queued->ledger, 0, closed + s.timelock_min_delay );
  ASSERT_TRUE( executed );
  EXPECT_EQ( g.state( *executed, 0, closed + s.timelock_min_delay, total_power ), proposal_state::executed );
  EXPECT_TRUE( timelock.is_done( *executed, *operation_index ) );
}

TEST_F( governor, execute_without_operation )
{
  propose();

  auto executed = g.execute( ledger, 0, 1'000 );
  ASSERT_FALSE( executed );
  EXPECT_EQ( executed.error(), governance_errc::operation_not_found );
}

// NOLINTEND
