#pragma once

#include <comitia/encode/decimal.hpp>
#include <comitia/encode/error.hpp>
#include <comitia/encode/hex.hpp>
