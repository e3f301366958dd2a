#pragma once
#include <chrono>
#include <string>
#include <mutex>
#include <unordered_map>

namespace vt::prof {

struct Sample { std::string name; double ms = 0.0; };

// Thread-safe accumulator. Samples are folded into running per-name stats, so
// memory depends on the number of distinct names only.
class Accumulator {
public:
    static Accumulator& instance();
    void add(Sample s);
    // Aggregate by name -> stats structure
    struct Stats { size_t count=0; double total_ms=0.0; double min_ms=0.0; double max_ms=0.0; double avg_ms=0.0; };
    std::unordered_map<std::string, Stats> aggregate();
    // Number of distinct sample names tracked.
    size_t tracked_names();
    // Logs one line per sample name at debug level.
    void log_summary();
    void clear();
private:
    std::mutex mtx_; std::unordered_map<std::string, Stats> stats_;
};

class ScopedTimer {
public:
    explicit ScopedTimer(const char* name): name_(name), start_(Clock::now()) {}
    ~ScopedTimer();
private:
    using Clock = std::chrono::steady_clock;
    const char* name_; Clock::time_point start_;
};

} // namespace vt::prof

#define VT_PP_CAT(a,b) VT_PP_CAT_INNER(a,b)
#define VT_PP_CAT_INNER(a,b) a##b

#ifndef VT_ENABLE_PROFILING
#define VT_ENABLE_PROFILING 1
#endif

#if VT_ENABLE_PROFILING
#define VT_PROFILE_SCOPE(name) ::vt::prof::ScopedTimer VT_PP_CAT(vt_prof_scope_u_, __COUNTER__){name}
#else
#define VT_PROFILE_SCOPE(name) do{}while(0)
#endif
