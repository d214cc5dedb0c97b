#pragma once

#include <comitia/config/config.hpp>
