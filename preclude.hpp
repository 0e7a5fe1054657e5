#pragma once

#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>

namespace ext {
using namespace tl;
}
