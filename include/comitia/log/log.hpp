#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <comitia/log/formatter.hpp>
#include <comitia/log/frontend.hpp>

namespace comitia::log {

void initialize() noexcept;
logger* instance() noexcept;

// Accepts quill level names such as "debug", "info" or "warning".
void set_level( std::string_view level );

} // namespace comitia::log
