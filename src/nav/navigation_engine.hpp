#pragma once
// =============================================================================
// NavigationEngine - 状態レジストリ + 実行ループ + スタック検出
// =============================================================================
// 1イテレーション:
//   1. current が訪問済みなら repeat_counter++
//        >= break_count     → Aborted (StuckLoop)
//        == max_stop_count  → nudge (fallback キー + nudge_pause)
//      未訪問なら repeat_counter = 0
//   2. visited に追加
//   3. 状態を実行（例外は onError で回復先へ、Failed として記録）
//   4. Transition を Telemetry に記録
//   5. current = to_state
//   6. state_transition_delay 待機
// 停止要求はイテレーション先頭で確認（実行中の状態は中断しない）。
// =============================================================================
#include "clock.hpp"
#include "config_loader.hpp"
#include "event_bus.hpp"
#include "nav/state.hpp"
#include "nav/telemetry.hpp"
#include "result.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace menupilot::nav {

enum class RunOutcome {
    Completed,     // current が空になった（終端 / 後続なし）
    Aborted,       // スタックループ上限 or 停止要求
    Interrupted    // イテレーション上限
};

enum class StopReason {
    ReachedTerminal,
    DeadEnd,          // Failed で後続なし
    StuckLoop,
    StopRequested,
    IterationBudget
};

const char* runOutcomeToString(RunOutcome o);
const char* stopReasonToString(StopReason r);

struct RunReport {
    RunOutcome outcome = RunOutcome::Completed;
    StopReason reason = StopReason::ReachedTerminal;
    int iterations = 0;
    int nudges = 0;
    std::optional<std::string> final_state;   // 停止時の current
    std::optional<std::string> last_executed;
};

// エンジンが借りるコラボレータ（所有はしない）
struct EngineServices {
    vision::MatchProbe& probe;
    vision::ClickOrchestrator& clicker;
    input::InputInjector& injector;
    Clock& clock;
    StopToken& stop;
    EventBus* bus = nullptr;
};

class NavigationEngine {
public:
    NavigationEngine(EngineServices services, config::AppConfig config);

    NavigationEngine(const NavigationEngine&) = delete;
    NavigationEngine& operator=(const NavigationEngine&) = delete;

    // 同一IDは上書き（警告ログ）。実行中は登録不可 → false
    bool registerState(std::unique_ptr<State> state);
    // 存在しない / 実行中 → false
    bool unregisterState(const std::string& state_id);

    State* getState(const std::string& state_id) const;
    std::vector<std::string> listStates() const;    // 登録順

    // 設定不正 / 実行中 / max_iterations < 1 → Err（ループは開始しない）
    Result<RunReport> run(const std::optional<std::string>& initial_state = std::nullopt,
                          std::optional<int> max_iterations = std::nullopt);

    // 協調停止。次のイテレーション先頭（またはプローブのポーリング）で効く。
    // run() は停止要求を消さない: 実行前に要求済みなら 0 イテレーションで Aborted。
    // 再開するには呼び出し側が StopToken::reset() する
    void stop();
    bool isRunning() const { return running_.load(); }

    // 実行スレッド以外からは telemetry().snapshot() を使う
    std::optional<std::string> currentState() const { return current_; }
    int repeatCounter() const { return repeat_counter_; }

    TelemetryAggregator& telemetry() { return telemetry_; }
    const TelemetryAggregator& telemetry() const { return telemetry_; }
    void clearHistory() { telemetry_.clearHistory(); }

    const config::AppConfig& config() const { return config_; }

private:
    Transition executeState(const std::string& state_id,
                            const std::optional<std::string>& previous);
    void nudge(const std::string& state_id);
    void publishRunState();

    EngineServices services_;
    config::AppConfig config_;
    std::vector<std::unique_ptr<State>> registry_;
    TelemetryAggregator telemetry_;

    std::atomic<bool> running_{false};

    // run スコープ（run() 開始時のみリセット）。実行スレッドのみが書く
    std::optional<std::string> current_;
    std::set<std::string> visited_;
    int repeat_counter_ = 0;
};

} // namespace menupilot::nav
