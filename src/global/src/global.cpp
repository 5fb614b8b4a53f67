#include <inboxkit/global.hpp>

log_level_t g_current_level = log_level_t::warning;
