#include "docmap/log.hpp"

#include <strings.h>

namespace docmap {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

log_level parse_log_level(const char* name, log_level fallback) {
    if (!name || !*name) return fallback;
    if (strcasecmp(name, "off") == 0) return log_level::off;
    if (strcasecmp(name, "error") == 0) return log_level::error;
    if (strcasecmp(name, "warn") == 0 || strcasecmp(name, "warning") == 0) return log_level::warn;
    if (strcasecmp(name, "info") == 0) return log_level::info;
    if (strcasecmp(name, "debug") == 0) return log_level::debug;
    return fallback;
}

} // namespace docmap
