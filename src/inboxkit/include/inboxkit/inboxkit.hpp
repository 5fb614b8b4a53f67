#pragma once

#include <inboxkit/global.hpp>

namespace inboxkit {
// Must bracket any header parsing or charset lookup.
expected<void> initialize();
expected<void> finalize();
}  // namespace inboxkit
