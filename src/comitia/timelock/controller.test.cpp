// NOLINTBEGIN

#include <gtest/gtest.h>

#include <limits>

#include <comitia/timelock/controller.hpp>

using comitia::governance::governance_errc;
using comitia::timelock::operation_state;

constexpr std::uint32_t proposal_id = 0x1234'5679;
constexpr std::uint32_t scheduled   = 1'000;

class controller: public ::testing::Test
{
public:
  controller():
      c( s )
  {
    auto receipt = c.schedule( ledger, proposal_id, scheduled, s.timelock_min_delay );
    if( receipt )
    {
      ledger       = receipt->ledger;
      operation_id = receipt->operation_id;
    }
    else
      ADD_FAILURE() << receipt.error().message();
  }

  comitia::governance::settings s;
  comitia::timelock::controller c;
  comitia::record::record ledger;
  std::uint32_t operation_id = 0;
};

TEST_F( controller, schedule )
{
  EXPECT_EQ( c.operation_count( ledger ), 1 );
  EXPECT_NE( operation_id, 0u );

  auto op = c.get_operation( ledger, 0 );
  ASSERT_TRUE( op );
  EXPECT_EQ( op->id, operation_id );
  EXPECT_EQ( op->proposal_id, proposal_id );
  EXPECT_EQ( op->ready_at, 173'800u );
  EXPECT_EQ( op->stored_state, operation_state::pending );
  EXPECT_EQ( op->predecessor_id, 0u );

  EXPECT_EQ( c.timestamp( ledger, 0 ), 173'800u );
  EXPECT_EQ( c.timestamp( ledger, 5 ), 0u );
  EXPECT_EQ( c.find_by_proposal( ledger, proposal_id ), 0 );
  EXPECT_EQ( c.find_by_id( ledger, operation_id ), 0 );
}

TEST_F( controller, lifecycle )
{
  const std::uint32_t ready_at = 173'800;

  EXPECT_EQ( c.state( ledger, 0, 100'000 ), operation_state::pending );
  EXPECT_TRUE( c.is_pending( ledger, 0, 100'000 ) );
  EXPECT_EQ( c.state( ledger, 0, ready_at ), operation_state::ready );
  EXPECT_EQ( c.state( ledger, 0, ready_at + s.timelock_grace_period / 2 ), operation_state::ready );
  EXPECT_EQ( c.state( ledger, 0, ready_at + s.timelock_grace_period ), operation_state::ready );
  EXPECT_EQ( c.state( ledger, 0, ready_at + s.timelock_grace_period + 1 ), operation_state::expired );
  EXPECT_TRUE( c.is_expired( ledger, 0, ready_at + s.timelock_grace_period + 1 ) );

  auto expired = c.execute( ledger, 0, ready_at + s.timelock_grace_period + 1 );
  ASSERT_FALSE( expired );
  EXPECT_EQ( expired.error(), governance_errc::op_expired );

  auto early = c.execute( ledger, 0, 100'000 );
  ASSERT_FALSE( early );
  EXPECT_EQ( early.error(), governance_errc::op_not_ready );

  auto executed = c.execute( ledger, 0, ready_at );
  ASSERT_TRUE( executed );
  EXPECT_TRUE( c.is_done( *executed, 0 ) );
  EXPECT_EQ( c.state( *executed, 0, ready_at + s.timelock_grace_period + 1 ), operation_state::done );

  auto twice = c.execute( *executed, 0, ready_at );
  ASSERT_FALSE( twice );
  EXPECT_EQ( twice.error(), governance_errc::op_not_ready );
}

TEST_F( controller, schedule_errors )
{
  auto receipt = c.schedule( ledger, 7, scheduled, s.timelock_min_delay - 1 );
  ASSERT_FALSE( receipt );
  EXPECT_EQ( receipt.error(), governance_errc::too_early );

  receipt = c.schedule( ledger, proposal_id, scheduled, s.timelock_min_delay );
  ASSERT_FALSE( receipt );
  EXPECT_EQ( receipt.error(), governance_errc::op_already_queued );

  receipt = c.schedule( ledger, 7, std::numeric_limits< std::uint32_t >::max(), s.timelock_min_delay );
  ASSERT_FALSE( receipt );
  EXPECT_EQ( receipt.error(), governance_errc::overflow );

  // Once the earlier operation has expired the proposal may be scheduled again.
  receipt = c.schedule( ledger, proposal_id, 173'800 + s.timelock_grace_period + 1, s.timelock_min_delay );
  ASSERT_TRUE( receipt );
  EXPECT_EQ( receipt->index, 1 );
  EXPECT_EQ( c.find_by_proposal( receipt->ledger, proposal_id ), 1 );
}

TEST_F( controller, capacity )
{
  s.max_operations = 2;
  comitia::timelock::controller limited( s );

  auto receipt = limited.schedule( ledger, 7, scheduled, s.timelock_min_delay );
  ASSERT_TRUE( receipt );

  auto full = limited.schedule( receipt->ledger, 9, scheduled, s.timelock_min_delay );
  ASSERT_FALSE( full );
  EXPECT_EQ( full.error(), governance_errc::capacity_exceeded );
}

TEST_F( controller, cancel )
{
  auto canceled = c.cancel( ledger, 0, 100'000 );
  ASSERT_TRUE( canceled );
  EXPECT_EQ( c.state( *canceled, 0, 100'000 ), operation_state::unset );

  auto again = c.cancel( *canceled, 0, 100'000 );
  ASSERT_FALSE( again );
  EXPECT_EQ( again.error(), governance_errc::op_not_ready );

  auto executed = c.execute( *canceled, 0, 173'800 );
  ASSERT_FALSE( executed );
  EXPECT_EQ( executed.error(), governance_errc::op_not_ready );

  auto rescheduled = c.schedule( *canceled, proposal_id, 100'000, s.timelock_min_delay );
  EXPECT_TRUE( rescheduled );
}

TEST_F( controller, unknown_operation )
{
  auto state = c.state( ledger, 1, scheduled );
  ASSERT_FALSE( state );
  EXPECT_EQ( state.error(), governance_errc::operation_not_found );

  auto op = c.get_operation( ledger, 1 );
  ASSERT_FALSE( op );
  EXPECT_EQ( op.error(), governance_errc::operation_not_found );

  EXPECT_FALSE( c.find_by_id( ledger, operation_id + 2 ) );
  EXPECT_FALSE( c.find_by_proposal( ledger, 7 ) );
  EXPECT_FALSE( c.is_pending( ledger, 1, scheduled ) );
  EXPECT_FALSE( c.is_done( ledger, 1 ) );
}

// NOLINTEND
