#pragma once

#include <algorithm>
#include <iostream>

// Set to 1 to enable debug output, 0 to disable. The build can override it.
#ifndef ENABLE_DEBUG
#define ENABLE_DEBUG 0
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
    if (ENABLE_DEBUG && level <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Helper class for collecting obstacle interaction stats
class DebugStats {
public:
    static void reset() {
        max_push = 0.0;
        total_push = 0.0;
        push_count = 0;
        escape_count = 0;
        spawn_failures = 0;
    }

    static void updatePush(double magnitude) {
        max_push = std::max(max_push, magnitude);
        total_push += magnitude;
        push_count++;
    }

    static void recordEscape() {
        escape_count++;
    }

    static void recordSpawnFailure() {
        spawn_failures++;
    }

    static int escapes() { return escape_count; }
    static int pushes() { return push_count; }
    static int spawnFailures() { return spawn_failures; }

    static void printInteractionStats() {
        DEBUG_MSG(DEBUG_LEVEL_BASIC,
            "Obstacle interaction stats:\n"
            "  Max push: " << max_push << " units/tick\n"
            "  Avg push: " << (push_count > 0 ? total_push / push_count : 0) << " units/tick\n"
            "  Pushes applied: " << push_count << "\n"
            "  Emergency escapes: " << escape_count << "\n"
            "  Failed spawn searches: " << spawn_failures << "\n"
        );
    }

private:
    static double max_push;
    static double total_push;
    static int push_count;
    static int escape_count;
    static int spawn_failures;
};
