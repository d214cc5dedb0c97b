#include <comitia/program/error.hpp>

#include <comitia/governance/error.hpp>
#include <comitia/record/error.hpp>

#include <string>
#include <utility>

namespace comitia::program {

struct _program_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "program";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< program_errc >( condition ) )
    {
      case program_errc::ok:
        return "ok"s;
      case program_errc::invalid_instruction:
        return "invalid instruction"s;
      case program_errc::invalid_argument:
        return "invalid argument"s;
    }
    std::unreachable();
  }
};

const std::error_category& program_category() noexcept
{
  static _program_category category;
  return category;
}

std::error_code make_error_code( program_errc e )
{
  return std::error_code( static_cast< int >( e ), program_category() );
}

std::int32_t exit_code( std::error_code ec ) noexcept
{
  if( !ec )
    return success_code;

  if( ec.category() == governance::governance_category() )
    return -ec.value();

  if( ec == record::record_errc::capacity_exceeded )
    return -std::to_underlying( governance::governance_errc::capacity_exceeded );

  return -std::to_underlying( governance::governance_errc::data_read );
}

} // namespace comitia::program
