#pragma once

#include <iostream>

// Build with -DTILTBOX_ENABLE_DEBUG=1 to enable debug output
#ifndef TILTBOX_ENABLE_DEBUG
#define TILTBOX_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef CURRENT_DEBUG_LEVEL
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (TILTBOX_ENABLE_DEBUG && level <= CURRENT_DEBUG_LEVEL) { \
        std::cerr << x; \
    } \
} while(0)

// Counters collected over one simulation step
class DebugStats {
public:
    static void reset() {
        gjk_calls = 0;
        collisions = 0;
        strong_collisions = 0;
    }

    static void recordNarrowPhase(bool collided, bool strong) {
        gjk_calls++;
        if (collided) {
            collisions++;
        }
        if (strong) {
            strong_collisions++;
        }
    }

    static void printCollisionStats() {
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE,
            "Collision stats:\n"
            "  Narrow phase tests: " << gjk_calls << "\n"
            "  Collisions: " << collisions << "\n"
            "  Strong collisions: " << strong_collisions << "\n"
        );
    }

private:
    static inline int gjk_calls = 0;
    static inline int collisions = 0;
    static inline int strong_collisions = 0;
};
