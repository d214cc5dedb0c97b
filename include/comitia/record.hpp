#pragma once

#include <comitia/record/error.hpp>
#include <comitia/record/key.hpp>
#include <comitia/record/record.hpp>
