#pragma once

// ============================================================================
// Tower Core Header
// ============================================================================
// Common includes and globals shared by the controller (tower), the
// shepherd daemon and the test binary. Include this in .cpp files that
// need logging or the debug level.
// ============================================================================

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <chrono>

#include "logger.h"
#include "debug.h"

// ============================================================================
// Global System Flags
// ============================================================================
// Defined once per executable (main.cpp, shepherd/shepherd_main.cpp,
// tests/test_stubs.cpp).

// Debug level (0=off, 1-9=increasing verbosity) - used by dprintf() macro
extern int g_debug_level;

// ============================================================================
// Common Utilities
// ============================================================================

namespace tower {
    // Current wall clock time in milliseconds since the epoch
    inline int64_t get_current_time_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    // Human readable errno text, e.g. "connect: Connection refused"
    std::string errno_string(const std::string& what, int err);
}
