/**
 * @file profile.hpp
 * @brief Scope timing for the simulation passes
 *
 * PROFILE_SCOPE("name") times the rest of the enclosing block. Scopes opened
 * while another is open are recorded as its children, so the tick and its
 * passes print as a tree:
 * @code
 * void IntegratorSystem::update(entt::registry& registry) {
 *     PROFILE_SCOPE("IntegratorSystem");
 *     // ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Profiling {

using Clock    = std::chrono::steady_clock;
using Duration = std::chrono::nanoseconds;

/**
 * @brief Accumulated timings of one named scope
 */
struct ScopeStats {
    std::uint64_t calls = 0;
    Duration total{0};
    Duration self{0};                 ///< total minus time spent in child scopes
    Duration fastest{Duration::max()};
    Duration slowest{0};

    std::string parent;               ///< empty for a root scope
    std::vector<std::string> children;
};

/**
 * @brief Process-wide table of scope timings. Single-threaded, like the tick.
 */
class Profiler {
public:
    /// Prints every scope as a tree with call counts and time shares.
    static void printStats();

    static std::optional<ScopeStats> getStats(const std::string& name);

    static void reset();

private:
    friend class ScopedProfiler;

    static void enter(const std::string& name);
    static void leave(const std::string& name);
};

class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string name;
};

} // namespace Profiling

#define PROFILE_JOIN_(a, b) a##b
#define PROFILE_JOIN(a, b) PROFILE_JOIN_(a, b)

#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_JOIN(profileScope_, __LINE__) { name }
