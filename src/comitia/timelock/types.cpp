#include <comitia/timelock/types.hpp>

#include <utility>

namespace comitia::timelock {

std::string_view to_string( operation_state s ) noexcept
{
  switch( s )
  {
    case operation_state::unset:
      return "unset";
    case operation_state::pending:
      return "pending";
    case operation_state::ready:
      return "ready";
    case operation_state::done:
      return "done";
    case operation_state::expired:
      return "expired";
  }
  std::unreachable();
}

} // namespace comitia::timelock
