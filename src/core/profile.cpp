/**
 * @file profile.cpp
 * @brief Implementation of the section timer described in profile.hpp
 */

#include "snooker/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& name, Duration duration) {
    auto& data = getInstance().sections[name];

    data.total_time += duration;
    data.call_count += 1;
    data.min_time = std::min(data.min_time, duration);
    data.max_time = std::max(data.max_time, duration);
}

Profiler::ProfileData Profiler::get(const std::string& name) {
    const auto& sections = getInstance().sections;
    auto it = sections.find(name);
    if (it == sections.end()) {
        return ProfileData{};
    }
    return it->second;
}

void Profiler::printStats() {
    const auto& sections = getInstance().sections;

    std::vector<std::pair<std::string, ProfileData>> ordered(sections.begin(), sections.end());
    std::sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
        return a.second.total_time > b.second.total_time;
    });

    std::cout << "\nProfiling Statistics:\n";
    for (const auto& [name, pd] : ordered) {
        double const totalMs = std::chrono::duration<double, std::milli>(pd.total_time).count();
        double const avgUs = pd.call_count > 0
            ? std::chrono::duration<double, std::micro>(pd.total_time).count() / pd.call_count
            : 0.0;

        std::cout << "  " << std::left << std::setw(28) << name
                  << " [" << pd.call_count << " calls] "
                  << std::fixed << std::setprecision(3) << totalMs << "ms total, "
                  << avgUs << "us avg\n";
    }
}

void Profiler::reset() {
    getInstance().sections.clear();
}

// ------------------ ScopedProfiler RAII Wrapper ------------------

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name)),
      start_time(Profiler::Clock::now())
{
}

ScopedProfiler::~ScopedProfiler() {
    auto const elapsed = std::chrono::duration_cast<Profiler::Duration>(
        Profiler::Clock::now() - start_time);
    Profiler::record(section_name, elapsed);
}

} // namespace Profiling
