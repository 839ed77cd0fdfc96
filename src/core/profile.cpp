#include "balldrop/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <unordered_map>
#include <utility>

#include "balldrop/core/debug.hpp"

namespace Profiling {

namespace {

struct OpenScope {
    std::string name;
    Clock::time_point started;
    Duration inChildren{0};
};

struct Table {
    std::unordered_map<std::string, ScopeStats> scopes;
    std::vector<OpenScope> open;
};

Table& table() {
    static Table instance;
    return instance;
}

double percentOf(Duration part, Duration whole) {
    if (whole.count() <= 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(part.count()) / static_cast<double>(whole.count());
}

void printScope(const Table& t, const std::string& name, const std::string& indent,
                bool last, Duration runTime) {
    const ScopeStats& s = t.scopes.at(name);
    double const ms = std::chrono::duration<double, std::milli>(s.total).count();
    double const avgUs = s.calls == 0 ? 0.0
        : std::chrono::duration<double, std::micro>(s.total).count() / static_cast<double>(s.calls);

    std::cout << indent << (last ? "`-- " : "|-- ") << name
              << "  calls " << s.calls
              << std::fixed << std::setprecision(2)
              << "  " << ms << " ms"
              << "  avg " << avgUs << " us"
              << "  " << percentOf(s.total, runTime) << "% total"
              << "  " << percentOf(s.self, runTime) << "% self\n";

    std::string const childIndent = indent + (last ? "    " : "|   ");
    for (std::size_t i = 0; i < s.children.size(); ++i) {
        printScope(t, s.children[i], childIndent, i + 1 == s.children.size(), runTime);
    }
}

} // namespace

void Profiler::enter(const std::string& name) {
    Table& t = table();
    ScopeStats& stats = t.scopes[name];

    // A scope keeps the parent it was first opened under
    if (stats.calls == 0 && stats.parent.empty() && !t.open.empty()) {
        const std::string& parent = t.open.back().name;
        if (parent != name) {
            stats.parent = parent;
            auto& siblings = t.scopes[parent].children;
            if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
                siblings.push_back(name);
            }
        }
    }

    t.open.push_back(OpenScope{name, Clock::now(), Duration{0}});
}

void Profiler::leave(const std::string& name) {
    Table& t = table();
    if (t.open.empty() || t.open.back().name != name) {
        WARN_MSG("Profiler", "scope '" << name << "' closed out of order");
        return;
    }

    OpenScope const frame = std::move(t.open.back());
    t.open.pop_back();

    Duration const elapsed = std::chrono::duration_cast<Duration>(Clock::now() - frame.started);
    ScopeStats& stats = t.scopes[name];
    ++stats.calls;
    stats.total += elapsed;
    stats.self += elapsed - frame.inChildren;
    stats.fastest = std::min(stats.fastest, elapsed);
    stats.slowest = std::max(stats.slowest, elapsed);

    if (!t.open.empty()) {
        t.open.back().inChildren += elapsed;
    }
}

std::optional<ScopeStats> Profiler::getStats(const std::string& name) {
    const Table& t = table();
    auto it = t.scopes.find(name);
    if (it == t.scopes.end() || it->second.calls == 0) {
        return std::nullopt;
    }
    return it->second;
}

void Profiler::printStats() {
    const Table& t = table();

    std::vector<std::string> roots;
    Duration runTime{0};
    for (const auto& [name, stats] : t.scopes) {
        if (stats.parent.empty()) {
            roots.push_back(name);
            runTime += stats.total;
        }
    }
    std::sort(roots.begin(), roots.end());

    std::cout << "\nProfile (" << roots.size() << " root scopes)\n";
    for (std::size_t i = 0; i < roots.size(); ++i) {
        printScope(t, roots[i], "", i + 1 == roots.size(), runTime);
    }
}

void Profiler::reset() {
    Table& t = table();
    t.scopes.clear();
    t.open.clear();
}

ScopedProfiler::ScopedProfiler(std::string name) : name(std::move(name)) {
    Profiler::enter(this->name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::leave(name);
}

} // namespace Profiling
