// =============================================================================
// State 派生型の実装
// =============================================================================
#include "nav/state.hpp"
#include "menupilot_log.hpp"

static constexpr const char* TAG = "state";

namespace menupilot::nav {

// =============================================================================
// State 既定フック
// =============================================================================

void State::onEnter() {
    MPLOG_INFO(TAG, "進入: %s (%s)", id_.c_str(), description_.c_str());
}

void State::onExit(const std::optional<std::string>& next) {
    MPLOG_DEBUG(TAG, "退出: %s -> %s", id_.c_str(), next ? next->c_str() : "(none)");
}

std::string State::onError(const std::exception& e) {
    MPLOG_ERROR(TAG, "%s 実行中に例外: %s → %s", id_.c_str(), e.what(), kRecoveryStateId);
    return kRecoveryStateId;
}

// =============================================================================
// ImageTransitionState
// =============================================================================

ImageTransitionState::ImageTransitionState(std::string id, std::string description,
                                           std::string target_image, std::string next_state,
                                           std::vector<std::string> alternatives,
                                           std::optional<double> timeout_sec,
                                           vision::Point click_offset)
    : State(std::move(id), std::move(description)),
      target_image_(std::move(target_image)),
      next_state_(std::move(next_state)),
      alternatives_(std::move(alternatives)),
      timeout_sec_(timeout_sec),
      click_offset_(click_offset) {}

StepResult ImageTransitionState::execute(StateContext& ctx) {
    std::vector<std::string> candidates = expectedImages();
    const int retries = ctx.config.vision.retries;

    if (ctx.clicker.findAndClick(candidates, retries, click_offset_, timeout_sec_)) {
        return {next_state_, TransitionOutcome::Success, {}};
    }

    // 失敗時は回復状態へ自動遷移しない（後続なし）
    StepResult r;
    r.outcome = TransitionOutcome::Failed;
    if (ctx.clicker.lastStats().stopped) {
        r.detail = "stop requested";
        return r;
    }
    r.detail = target_image_ + " not found after " + std::to_string(ctx.clicker.lastStats().attempts) +
               " attempt(s)";
    return r;
}

std::vector<std::string> ImageTransitionState::expectedImages() const {
    std::vector<std::string> images;
    images.reserve(1 + alternatives_.size());
    images.push_back(target_image_);
    images.insert(images.end(), alternatives_.begin(), alternatives_.end());
    return images;
}

// =============================================================================
// UndefinedRecoveryState
// =============================================================================

UndefinedRecoveryState::UndefinedRecoveryState(RecoveryTable table, std::string id,
                                               vision::Point safe_point, double pause_sec)
    : State(std::move(id), "未定義画面 - 現在地の再推定"),
      table_(std::move(table)),
      safe_point_(safe_point),
      pause_sec_(pause_sec) {}

StepResult UndefinedRecoveryState::execute(StateContext& ctx) {
    // ホバー表示が識別画像を隠さないよう、ポインタを画面隅へ退避
    if (!ctx.injector.movePointer(safe_point_.x, safe_point_.y, ctx.config.vision.click_duration_sec)) {
        MPLOG_WARN(TAG, "%s: ポインタ退避失敗 (%d,%d)", id().c_str(), safe_point_.x, safe_point_.y);
    }

    vision::ProbeOptions opts;
    opts.timeout_sec = ctx.config.vision.recovery_probe_timeout_sec;
    opts.poll_interval_sec = ctx.config.vision.check_interval_sec;
    opts.threshold = ctx.config.vision.threshold;

    for (const auto& [image, target] : table_) {
        if (ctx.stopRequested()) break;
        vision::MatchResult m = ctx.probe.probe(image, opts);
        if (m.found) {
            MPLOG_INFO(TAG, "%s: %s 検出 (conf=%.3f) → %s", id().c_str(), image.c_str(),
                       m.confidence, target.c_str());
            return {target, TransitionOutcome::Success, {}};
        }
    }

    if (ctx.stopRequested()) {
        MPLOG_INFO(TAG, "%s: 停止要求で照合中断", id().c_str());
        return {id(), TransitionOutcome::Retry, "stop requested"};
    }

    MPLOG_WARN(TAG, "%s: 画面を識別できない → fallback '%s' して再試行",
               id().c_str(), ctx.clicker.fallbackKey().c_str());
    (void)ctx.clicker.pressFallbackKey();
    ctx.clock.sleepFor(fromSeconds(pause_sec_));
    return {id(), TransitionOutcome::Retry, "no known screen matched"};
}

std::vector<std::string> UndefinedRecoveryState::expectedImages() const {
    std::vector<std::string> images;
    for (const auto& entry : table_) images.push_back(entry.first);
    return images;
}

// =============================================================================
// TerminalState / FunctionState
// =============================================================================

StepResult TerminalState::execute(StateContext& ctx) {
    (void)ctx;
    MPLOG_INFO(TAG, "終端状態 %s に到達", id().c_str());
    return {std::nullopt, TransitionOutcome::Terminated, {}};
}

FunctionState::FunctionState(std::string id, std::string description, Handler handler,
                             std::vector<std::string> images)
    : State(std::move(id), std::move(description)),
      handler_(std::move(handler)),
      images_(std::move(images)) {}

StepResult FunctionState::execute(StateContext& ctx) {
    if (!handler_) {
        return {std::nullopt, TransitionOutcome::Failed, "no handler"};
    }
    return handler_(ctx);
}

} // namespace menupilot::nav
