#pragma once

#include <fmt/core.h>

namespace peerlink::compat {
    using fmt::format;
}
