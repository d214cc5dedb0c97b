#pragma once

#include <comitia/host/file_host.hpp>
