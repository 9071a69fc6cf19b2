/**
 * @file profile.hpp
 * @brief Scope timers for the engine's hot paths
 *
 * The advance loop, the integrator, collision detection and both solvers open
 * a PROFILE_SCOPE. Timings nest by call stack, so a printed summary shows how
 * much of an advance() went to each phase:
 * @code
 * void ImpulseSim::findCollisions(...) {
 *     PROFILE_SCOPE("ImpulseSim::findCollisions");
 *     // ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <stack>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide collector of scope timings (singleton).
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timings of one named scope
     */
    struct ProfileData {
        Duration total_time{0};
        Duration self_time{0};           ///< total minus time spent in child scopes
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};

        std::string parent_name;
        std::vector<std::string> children;
    };

    static void startSection(const std::string& name);

    /**
     * @brief Closes the innermost open scope
     *
     * Mismatched names are reported on stderr and ignored.
     */
    static void endSection(const std::string& name);

    /** @brief Prints the scope tree with call counts and time shares */
    static void printStats();

    static void reset();

    /** @brief Number of completed entries into the named scope */
    static uint64_t callCount(const std::string& name);

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::stack<std::string> scope_stack;

    Profiler() = default;

    static Profiler& getInstance();

    static void printNode(const std::string& name,
                          const std::string& prefix,
                          bool is_last,
                          Duration total_program_time);
};

/**
 * @brief RAII guard: starts a section on construction and ends it on destruction.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define RIGID2D_PROFILE_CONCAT_INNER(a, b) a##b
#define RIGID2D_PROFILE_CONCAT(a, b) RIGID2D_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler RIGID2D_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
