/**
 * @file profile.hpp
 * @brief Lightweight section timers for the simulation loop
 *
 * Sections are timed with an RAII guard and aggregated by name (total time,
 * call count, min/max). A section opened while another one is active is
 * recorded under the qualified name "Parent/Child", so the printed summary
 * reads as a tree. Aggregation is guarded by a mutex: the runner thread
 * records while a front end may print.
 *
 * Example usage:
 * @code
 * void step() {
 *     PROFILE_SCOPE("Step");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace Profiling {

class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing statistics for a named section
     */
    struct ProfileData {
        Duration total_time{0};
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
    };

    /**
     * @brief Adds one measurement to a section
     * @param qualifiedName Section name including its parents, "/" separated
     */
    static void record(const std::string& qualifiedName, Duration duration);

    /**
     * @brief Copy of the data recorded for a section, zeroed if unknown
     */
    static ProfileData statsFor(const std::string& qualifiedName);

    /**
     * @brief Prints every section, children indented under their parents
     */
    static void printStats();

    static void reset();

private:
    Profiler() = default;
    static Profiler& getInstance();

    std::mutex mutex;
    std::map<std::string, ProfileData> sections;  // ordered so children follow parents
};

/**
 * @brief RAII guard timing the enclosing scope
 *
 * Keeps a per-thread stack of open section names to build qualified names.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(const std::string& name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string qualified_name;
    std::string parent_name;
    Profiler::Clock::time_point start_time;
};

} // namespace Profiling

#define TILTBOX_PROFILE_CONCAT_INNER(a, b) a##b
#define TILTBOX_PROFILE_CONCAT(a, b) TILTBOX_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing scope under the given name
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler TILTBOX_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
