#include "core/profiling.hpp"
#include "core/log.hpp"

#include <algorithm>

namespace vt::prof {

Accumulator& Accumulator::instance() {
	static Accumulator inst;
	return inst;
}

void Accumulator::add(Sample s) {
	std::scoped_lock lock(mtx_);
	auto it = stats_.find(s.name);
	if (it == stats_.end()) {
		Stats st;
		st.min_ms = s.ms;
		st.max_ms = s.ms;
		it = stats_.emplace(std::move(s.name), st).first;
	}
	Stats& st = it->second;
	++st.count;
	st.total_ms += s.ms;
	st.min_ms = std::min(st.min_ms, s.ms);
	st.max_ms = std::max(st.max_ms, s.ms);
}

std::unordered_map<std::string, Accumulator::Stats> Accumulator::aggregate() {
	std::scoped_lock lock(mtx_);
	std::unordered_map<std::string, Stats> out = stats_;
	for (auto& kv : out) {
		kv.second.avg_ms = kv.second.total_ms / static_cast<double>(kv.second.count);
	}
	return out;
}

size_t Accumulator::tracked_names() {
	std::scoped_lock lock(mtx_);
	return stats_.size();
}

void Accumulator::log_summary() {
	for (const auto& kv : aggregate()) {
		const Stats& st = kv.second;
		vt::log::debug("PROFILE " + kv.first + ": count=" + std::to_string(st.count) +
		               " avg_ms=" + std::to_string(st.avg_ms) +
		               " min_ms=" + std::to_string(st.min_ms) +
		               " max_ms=" + std::to_string(st.max_ms));
	}
}

void Accumulator::clear() {
	std::scoped_lock lock(mtx_);
	stats_.clear();
}

ScopedTimer::~ScopedTimer() {
	auto end = Clock::now();
	double ms = std::chrono::duration<double, std::milli>(end - start_).count();
	Accumulator::instance().add({name_, ms});
}

} // namespace vt::prof
