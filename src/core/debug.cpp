#include "snooker/core/debug.hpp"

// Initialize static members
double DebugStats::max_push = 0.0;
double DebugStats::total_push = 0.0;
int DebugStats::push_count = 0;
int DebugStats::escape_count = 0;
int DebugStats::spawn_failures = 0;
