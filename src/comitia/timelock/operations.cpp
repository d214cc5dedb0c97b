#include <comitia/timelock/operations.hpp>

#include <comitia/encode/decimal.hpp>
#include <comitia/record/key.hpp>

#include <utility>

namespace comitia::timelock {

using governance::governance_errc;

operations::operations( const governance::settings& s ) noexcept:
    _controller( s )
{}

const controller& operations::timelock() const noexcept
{
  return _controller;
}

result< schedule_receipt > operations::schedule_with_predecessor( const record::record& r,
                                                                  std::uint32_t proposal_id,
                                                                  std::uint32_t predecessor_id,
                                                                  std::uint32_t now,
                                                                  std::uint32_t delay ) const
{
  auto receipt = _controller.schedule( r, proposal_id, now, delay );
  if( !receipt )
    return receipt;

  auto updated = receipt->ledger.append_entry(
    record::key::operation( receipt->index, record::key::operation_field::predecessor ),
    encode::to_decimal( predecessor_id ) );

  if( !updated )
    return std::unexpected( updated.error() );

  receipt->ledger = std::move( *updated );
  return receipt;
}

result< record::record >
operations::execute_with_predecessor_check( const record::record& r, std::uint8_t index, std::uint32_t now ) const
{
  if( auto id = predecessor( r, index ); id != 0 && !predecessor_done( r, id ) )
    return std::unexpected( governance_errc::op_not_ready );

  return _controller.execute( r, index, now );
}

std::uint32_t operations::predecessor( const record::record& r, std::uint8_t index ) const
{
  return record::read_number< std::uint32_t >(
           r,
           record::key::operation( index, record::key::operation_field::predecessor ) )
    .value_or( 0 );
}

bool operations::predecessor_done( const record::record& r, std::uint32_t predecessor_id ) const
{
  auto index = _controller.find_by_id( r, predecessor_id );
  return index && _controller.is_done( r, *index );
}

} // namespace comitia::timelock
