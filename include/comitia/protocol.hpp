#pragma once

#include <comitia/protocol/account.hpp>
