#pragma once

#include <comitia/log/formatter.hpp>
#include <comitia/log/frontend.hpp>
#include <comitia/log/log.hpp>
