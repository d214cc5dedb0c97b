#pragma once

#include <string>

#include <quill/DeferredFormatCodec.h>

#include <comitia/governance/types.hpp>
#include <comitia/protocol/account.hpp>
#include <comitia/timelock/types.hpp>

namespace comitia::log {

// Renders a 20-byte account as 0x-prefixed hex.
struct account
{
  protocol::account value;
};

} // namespace comitia::log

template<>
struct fmtquill::formatter< comitia::log::account >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const comitia::log::account& a, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "0x{}", comitia::protocol::to_hex( a.value ) );
  }
};

template<>
struct quill::Codec< comitia::log::account >: quill::DeferredFormatCodec< comitia::log::account >
{};

template<>
struct fmtquill::formatter< comitia::governance::proposal_state >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( comitia::governance::proposal_state s, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", comitia::governance::to_string( s ) );
  }
};

template<>
struct quill::Codec< comitia::governance::proposal_state >:
    quill::DeferredFormatCodec< comitia::governance::proposal_state >
{};

template<>
struct fmtquill::formatter< comitia::timelock::operation_state >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( comitia::timelock::operation_state s, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", comitia::timelock::to_string( s ) );
  }
};

template<>
struct quill::Codec< comitia::timelock::operation_state >:
    quill::DeferredFormatCodec< comitia::timelock::operation_state >
{};
