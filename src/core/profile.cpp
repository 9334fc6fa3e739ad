/**
 * @file profile.cpp
 * @brief Implementation of the section timers described in profile.hpp
 */

#include "tiltbox/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

namespace Profiling {

namespace {
// Qualified name of the innermost open section on this thread
thread_local std::string currentSection;
}

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& qualifiedName, Duration duration) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex);

    auto& data = instance.sections[qualifiedName];
    data.total_time += duration;
    data.call_count += 1;
    data.min_time = std::min(data.min_time, duration);
    data.max_time = std::max(data.max_time, duration);
}

Profiler::ProfileData Profiler::statsFor(const std::string& qualifiedName) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex);

    auto it = instance.sections.find(qualifiedName);
    return it == instance.sections.end() ? ProfileData{} : it->second;
}

void Profiler::printStats() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex);

    std::cout << "\nProfiling Statistics:\n";
    for (auto const& [name, data] : instance.sections) {
        auto const depth = std::count(name.begin(), name.end(), '/');
        auto const leaf = name.substr(name.find_last_of('/') + 1);
        auto const totalMs = std::chrono::duration<double, std::milli>(data.total_time).count();
        auto const avgUs = data.call_count > 0
            ? std::chrono::duration<double, std::micro>(data.total_time).count() / data.call_count
            : 0.0;

        std::cout << std::string(static_cast<size_t>(depth) * 4, ' ') << "- "
                  << leaf << " [" << data.call_count << " calls] "
                  << std::fixed << std::setprecision(2) << totalMs << "ms (avg: "
                  << avgUs << "us)\n";
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.mutex);
    instance.sections.clear();
}

ScopedProfiler::ScopedProfiler(const std::string& name)
    : qualified_name(currentSection.empty() ? name : currentSection + "/" + name)
    , parent_name(currentSection)
    , start_time(Profiler::Clock::now())
{
    currentSection = qualified_name;
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::record(qualified_name, Profiler::Clock::now() - start_time);
    currentSection = parent_name;
}

} // namespace Profiling
