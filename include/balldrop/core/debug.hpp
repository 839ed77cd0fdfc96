#pragma once

#include <iostream>

// Build with -DBALLDROP_DEBUG_LEVEL=1 (basic) or 2 (verbose) for output
#ifndef BALLDROP_DEBUG_LEVEL
#define BALLDROP_DEBUG_LEVEL 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if ((level) <= BALLDROP_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Recovered error conditions; always printed
#define WARN_MSG(tag, x) do { \
    std::cerr << "[" << tag << "] Warning: " << x << "\n"; \
} while(0)
