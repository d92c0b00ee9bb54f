#pragma once

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace zk_insurance {
namespace debug {

/**
 * Debug Control
 *
 * Environment variables:
 * - ZKI_DEBUG: Enable/disable debug output (raw protocol lines, stage
 *   command lines, captured tool output)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 */

// Check if debug printing is enabled
// Sessions run on their own threads, so the cache is a function-local static
inline bool is_debug_enabled() {
    static const bool cached = [] {
        const char* env = std::getenv("ZKI_DEBUG");
        return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
    }();
    return cached;
}

} // namespace debug
} // namespace zk_insurance

// Debug printing (detailed protocol and subprocess traces)
#define ZKI_DEBUG_ENABLED() (zk_insurance::debug::is_debug_enabled())

#define ZKI_DEBUG_COUT(expr) \
    do { \
        if (zk_insurance::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)
