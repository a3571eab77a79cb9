/**
 * @file profile.hpp
 * @brief Lightweight timing of named code sections
 *
 * Each system wraps its update in PROFILE_SCOPE so a run of the simulator
 * can report how much of a tick went to prediction, obstacle handling and
 * the motion systems. Sections are aggregated by name:
 * - call count
 * - total, min and max duration
 *
 * Example usage:
 * @code
 * void ObstacleSystem::update(...) {
 *     PROFILE_SCOPE("ObstacleSystem");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide store of section timings.
 *
 * Singleton; use the static methods.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated statistics for one named section
     */
    struct ProfileData {
        Duration total_time{0};
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
    };

    /**
     * @brief Adds one measured duration to the named section.
     */
    static void record(const std::string& name, Duration duration);

    /**
     * @brief Returns the statistics of a section, or an empty record if it never ran.
     */
    static ProfileData get(const std::string& name);

    /**
     * @brief Print all sections, slowest first, to stdout.
     */
    static void printStats();

    /**
     * @brief Discard all recorded data.
     */
    static void reset();

private:
    std::unordered_map<std::string, ProfileData> sections;

    Profiler() = default;

    static Profiler& getInstance();
};

/**
 * @brief RAII guard that times the enclosing scope.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
    Profiler::TimePoint start_time;
};

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the current scope under the given section name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
