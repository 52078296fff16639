#pragma once

#include <tl/expected.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace ext {
using namespace tl;
}
