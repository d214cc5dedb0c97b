#pragma once

#include <filesystem>

#include <yaml-cpp/yaml.h>

#include <comitia/governance/error.hpp>
#include <comitia/governance/settings.hpp>

namespace comitia::config {

using governance::result;

constexpr auto governance_section = "governance";

/**
 * Reads governance settings from the governance section of a YAML document.
 * Keys that are absent keep their default, unknown keys are ignored.
 */
result< governance::settings > parse( const YAML::Node& document );

// A missing file yields the defaults.
result< governance::settings > load( const std::filesystem::path& path );

std::error_code validate( const governance::settings& s ) noexcept;

} // namespace comitia::config
