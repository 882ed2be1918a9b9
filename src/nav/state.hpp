#pragma once
// =============================================================================
// State - ナビゲーション状態（1画面 = 1状態）
// =============================================================================
// NavigationEngine は State の能力 (execute / onEnter / onExit / onError /
// canEnterFrom) だけに依存し、具体的な派生型は知らない。
//
//   ImageTransitionState : 画像を探してクリック → 次状態。失敗は後続なし
//   UndefinedRecoveryState: 既知画面の識別画像で現在地を推定。自己遷移可
//   TerminalState        : 常に後続なし（正常終了）
//   FunctionState        : 任意の callable で判定するユーザー定義状態
// =============================================================================
#include "clock.hpp"
#include "config_loader.hpp"
#include "input/input_injector.hpp"
#include "vision/click_orchestrator.hpp"
#include "vision/match_probe.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace menupilot::nav {

inline constexpr const char* kRecoveryStateId = "undefined_menu";

enum class TransitionOutcome {
    Success,
    Failed,
    Retry,        // 自己遷移（UndefinedRecovery の再試行）
    Terminated    // 終端状態の実行
};

inline const char* outcomeToString(TransitionOutcome o) {
    switch (o) {
        case TransitionOutcome::Success:    return "Success";
        case TransitionOutcome::Failed:     return "Failed";
        case TransitionOutcome::Retry:      return "Retry";
        case TransitionOutcome::Terminated: return "Terminated";
    }
    return "Unknown";
}

// 1回の状態実行の記録（追記のみ）
struct Transition {
    std::string from_state;
    std::optional<std::string> to_state;    // nullopt = 後続なし
    std::chrono::system_clock::time_point timestamp;
    double execution_sec = 0.0;
    TransitionOutcome outcome = TransitionOutcome::Success;
    std::string error_detail;               // 空 = なし

    bool succeeded() const {
        return outcome == TransitionOutcome::Success || outcome == TransitionOutcome::Terminated;
    }
};

struct StateStats {
    int execution_count = 0;
    int success_count = 0;     // Success + Terminated
    int failure_count = 0;
    int retry_count = 0;
    double total_time_sec = 0.0;
    std::vector<Transition> transitions;

    double averageTimeSec() const {
        return execution_count > 0 ? total_time_sec / execution_count : 0.0;
    }
};

// execute() の戻り値
struct StepResult {
    std::optional<std::string> next;
    TransitionOutcome outcome = TransitionOutcome::Success;
    std::string detail;
};

// 状態実行時に渡されるコラボレータ一式（NavigationEngine が所有者から借りる）
struct StateContext {
    vision::MatchProbe& probe;
    vision::ClickOrchestrator& clicker;
    input::InputInjector& injector;
    Clock& clock;
    const config::AppConfig& config;
    const StopToken* stop = nullptr;

    bool stopRequested() const { return stop && stop->requested(); }
};

class State {
public:
    State(std::string id, std::string description)
        : id_(std::move(id)), description_(std::move(description)) {}
    virtual ~State() = default;

    const std::string& id() const { return id_; }
    const std::string& description() const { return description_; }

    virtual StepResult execute(StateContext& ctx) = 0;

    virtual void onEnter();
    virtual void onExit(const std::optional<std::string>& next);

    // 状態内の予期しない例外 → 回復先の状態ID。既定は常に undefined_menu
    virtual std::string onError(const std::exception& e);

    // 遷移ガード。既定は全許可
    virtual bool canEnterFrom(const std::string& previous) const {
        (void)previous;
        return true;
    }

    // この状態が必要とするテンプレート画像（環境検証用）
    virtual std::vector<std::string> expectedImages() const { return {}; }

private:
    std::string id_;
    std::string description_;
};

class ImageTransitionState : public State {
public:
    ImageTransitionState(std::string id, std::string description,
                         std::string target_image, std::string next_state,
                         std::vector<std::string> alternatives = {},
                         std::optional<double> timeout_sec = std::nullopt,
                         vision::Point click_offset = {});

    StepResult execute(StateContext& ctx) override;
    std::vector<std::string> expectedImages() const override;

    const std::string& targetImage() const { return target_image_; }
    const std::string& nextState() const { return next_state_; }
    const std::vector<std::string>& alternatives() const { return alternatives_; }

private:
    std::string target_image_;
    std::string next_state_;
    std::vector<std::string> alternatives_;
    std::optional<double> timeout_sec_;
    vision::Point click_offset_;
};

class UndefinedRecoveryState : public State {
public:
    // (識別画像, 遷移先) の順序付きテーブル
    using RecoveryTable = std::vector<std::pair<std::string, std::string>>;

    explicit UndefinedRecoveryState(RecoveryTable table,
                                    std::string id = kRecoveryStateId,
                                    vision::Point safe_point = {10, 10},
                                    double pause_sec = 1.0);

    StepResult execute(StateContext& ctx) override;
    std::vector<std::string> expectedImages() const override;

    const RecoveryTable& table() const { return table_; }

private:
    RecoveryTable table_;
    vision::Point safe_point_;
    double pause_sec_;
};

class TerminalState : public State {
public:
    using State::State;

    StepResult execute(StateContext& ctx) override;
};

class FunctionState : public State {
public:
    using Handler = std::function<StepResult(StateContext&)>;

    FunctionState(std::string id, std::string description, Handler handler,
                  std::vector<std::string> images = {});

    StepResult execute(StateContext& ctx) override;
    std::vector<std::string> expectedImages() const override { return images_; }

private:
    Handler handler_;
    std::vector<std::string> images_;
};

} // namespace menupilot::nav
