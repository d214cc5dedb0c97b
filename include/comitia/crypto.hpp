#pragma once

#include <comitia/crypto/hash.hpp>
