#pragma once

#include <comitia/governance/arithmetic.hpp>
#include <comitia/governance/counting.hpp>
#include <comitia/governance/delegation.hpp>
#include <comitia/governance/error.hpp>
#include <comitia/governance/governor.hpp>
#include <comitia/governance/membership.hpp>
#include <comitia/governance/settings.hpp>
#include <comitia/governance/signatures.hpp>
#include <comitia/governance/types.hpp>
