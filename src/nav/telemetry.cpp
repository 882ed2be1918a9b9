// =============================================================================
// TelemetryAggregator 実装
// =============================================================================
#include "nav/telemetry.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace menupilot::nav {

namespace {

double rate(int ok, int total) {
    return total > 0 ? (double)ok / total : 0.0;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)ms);
    return buf;
}

nlohmann::json transitionJson(const Transition& t) {
    nlohmann::json j = {
        {"from", t.from_state},
        {"to", t.to_state ? nlohmann::json(*t.to_state) : nlohmann::json(nullptr)},
        {"timestamp", formatTimestamp(t.timestamp)},
        {"execution_sec", t.execution_sec},
        {"outcome", outcomeToString(t.outcome)},
    };
    if (!t.error_detail.empty()) j["error"] = t.error_detail;
    return j;
}

} // namespace

void TelemetryAggregator::record(const Transition& t) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = states_[t.from_state];
    s.execution_count++;
    s.total_time_sec += t.execution_sec;
    switch (t.outcome) {
        case TransitionOutcome::Success:
        case TransitionOutcome::Terminated: s.success_count++; break;
        case TransitionOutcome::Failed:     s.failure_count++; break;
        case TransitionOutcome::Retry:      s.retry_count++;   break;
    }
    s.transitions.push_back(t);
    history_.push_back(t);
}

void TelemetryAggregator::setRunState(const std::optional<std::string>& current,
                                      const std::set<std::string>& visited,
                                      int repeat_counter, bool running) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = current;
    visited_ = visited;
    repeat_counter_ = repeat_counter;
    running_ = running;
}

TelemetrySnapshot TelemetryAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TelemetrySnapshot snap;
    snap.total_transitions = (int)history_.size();
    for (const auto& t : history_) {
        if (t.succeeded()) snap.successful_transitions++;
    }
    snap.success_rate = rate(snap.successful_transitions, snap.total_transitions);
    snap.current_state = current_;
    snap.visited.assign(visited_.begin(), visited_.end());
    snap.repeat_counter = repeat_counter_;
    snap.running = running_;
    snap.states = states_;
    snap.history = history_;
    return snap;
}

std::optional<StateStats> TelemetryAggregator::stateStats(const std::string& state_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(state_id);
    if (it == states_.end()) return std::nullopt;
    return it->second;
}

int TelemetryAggregator::totalTransitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return (int)history_.size();
}

double TelemetryAggregator::successRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int ok = 0;
    for (const auto& t : history_) {
        if (t.succeeded()) ok++;
    }
    return rate(ok, (int)history_.size());
}

void TelemetryAggregator::clearHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.clear();
    history_.clear();
}

std::string TelemetryAggregator::formatReport() const {
    TelemetrySnapshot snap = snapshot();
    std::ostringstream os;
    os << std::fixed;

    os << "=== Navigation statistics ===\n";
    os << "current state : " << (snap.current_state ? *snap.current_state : std::string("(none)")) << "\n";
    os << "transitions   : " << snap.total_transitions << " (success " << snap.successful_transitions
       << ", rate " << std::setprecision(1) << snap.success_rate * 100.0 << "%)\n";
    os << "visited       : " << snap.visited.size() << ", repeat counter " << snap.repeat_counter << "\n";

    if (!snap.states.empty()) {
        // 長い状態IDは列を押し広げるだけで切り詰めない
        os << std::left << std::setw(20) << "state" << std::right
           << ' ' << std::setw(6) << "exec" << ' ' << std::setw(6) << "ok"
           << ' ' << std::setw(6) << "fail" << ' ' << std::setw(6) << "retry"
           << ' ' << std::setw(9) << "avg(s)" << "\n";
        os << std::setprecision(3);
        for (const auto& [id, s] : snap.states) {
            os << std::left << std::setw(20) << id << std::right
               << ' ' << std::setw(6) << s.execution_count << ' ' << std::setw(6) << s.success_count
               << ' ' << std::setw(6) << s.failure_count << ' ' << std::setw(6) << s.retry_count
               << ' ' << std::setw(9) << s.averageTimeSec() << "\n";
        }
    }
    return os.str();
}

std::string TelemetryAggregator::toJson(int indent) const {
    TelemetrySnapshot snap = snapshot();

    nlohmann::json j;
    j["total_transitions"] = snap.total_transitions;
    j["successful_transitions"] = snap.successful_transitions;
    j["success_rate"] = snap.success_rate;
    j["current_state"] = snap.current_state ? nlohmann::json(*snap.current_state)
                                            : nlohmann::json(nullptr);
    j["visited_states"] = snap.visited;
    j["repeat_counter"] = snap.repeat_counter;
    j["running"] = snap.running;

    nlohmann::json states = nlohmann::json::object();
    for (const auto& [id, s] : snap.states) {
        states[id] = {
            {"execution_count", s.execution_count},
            {"success_count", s.success_count},
            {"failure_count", s.failure_count},
            {"retry_count", s.retry_count},
            {"total_time_sec", s.total_time_sec},
            {"average_time_sec", s.averageTimeSec()},
        };
    }
    j["state_stats"] = states;

    nlohmann::json history = nlohmann::json::array();
    for (const auto& t : snap.history) history.push_back(transitionJson(t));
    j["transition_history"] = history;

    return j.dump(indent);
}

} // namespace menupilot::nav
