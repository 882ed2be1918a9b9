#pragma once
// =============================================================================
// TelemetryAggregator - 状態ごとの実行統計 + 遷移履歴
// =============================================================================
// 書き込みは NavigationEngine（実行スレッド）のみ。snapshot() は別スレッド
// （interactive の status/stats、シグナル後の表示）からも呼べる。
// 履歴は run() をまたいで保持し、clearHistory() でのみ消去。
// =============================================================================
#include "nav/state.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace menupilot::nav {

struct TelemetrySnapshot {
    int total_transitions = 0;
    int successful_transitions = 0;
    double success_rate = 0.0;                 // total == 0 なら 0
    std::optional<std::string> current_state;
    std::vector<std::string> visited;          // 辞書順
    int repeat_counter = 0;
    bool running = false;
    std::map<std::string, StateStats> states;
    std::vector<Transition> history;
};

class TelemetryAggregator {
public:
    // 状態別履歴 → 全体履歴の順に追記
    void record(const Transition& t);

    void setRunState(const std::optional<std::string>& current,
                     const std::set<std::string>& visited,
                     int repeat_counter, bool running);

    TelemetrySnapshot snapshot() const;
    std::optional<StateStats> stateStats(const std::string& state_id) const;
    int totalTransitions() const;
    double successRate() const;

    void clearHistory();

    std::string formatReport() const;
    std::string toJson(int indent = 2) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, StateStats> states_;
    std::vector<Transition> history_;
    std::optional<std::string> current_;
    std::set<std::string> visited_;
    int repeat_counter_ = 0;
    bool running_ = false;
};

} // namespace menupilot::nav
