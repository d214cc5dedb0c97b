#pragma once

#include <comitia/program/dao.hpp>
#include <comitia/program/error.hpp>
#include <comitia/program/execution_guard.hpp>
#include <comitia/program/program.hpp>
#include <comitia/program/system_interface.hpp>
