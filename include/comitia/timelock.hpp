#pragma once

#include <comitia/timelock/controller.hpp>
#include <comitia/timelock/operations.hpp>
#include <comitia/timelock/types.hpp>
