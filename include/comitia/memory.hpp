#pragma once

#include <comitia/memory/memory.hpp>
