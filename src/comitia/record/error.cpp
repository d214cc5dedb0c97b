#include <comitia/record/error.hpp>

#include <string>
#include <utility>

namespace comitia::record {

struct _record_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "record";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< record_errc >( condition ) )
    {
      case record_errc::ok:
        return "ok"s;
      case record_errc::capacity_exceeded:
        return "record capacity exceeded"s;
      case record_errc::missing_entry:
        return "missing entry"s;
      case record_errc::invalid_key:
        return "invalid key"s;
      case record_errc::invalid_value:
        return "invalid value"s;
    }
    std::unreachable();
  }
};

const std::error_category& record_category() noexcept
{
  static _record_category category;
  return category;
}

std::error_code make_error_code( record_errc e )
{
  return std::error_code( static_cast< int >( e ), record_category() );
}

} // namespace comitia::record
