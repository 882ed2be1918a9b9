#pragma once
// =============================================================================
// ClickOrchestrator - find & click with bounded retries
// =============================================================================
// 1試行 = 候補テンプレートを順にプローブ（最初の検出が勝ち）
//   検出 → ポインタ移動(中心 + offset) → click → post_click_delay → true
//   未検出 / 注入失敗 → fallback_key 押下 → delay_between_retries → 次の試行
// retries 回すべて失敗で false。
// 通常動作中に fallback キーを押すのはここだけ。
// =============================================================================
#include "clock.hpp"
#include "config_loader.hpp"
#include "event_bus.hpp"
#include "input/input_injector.hpp"
#include "vision/match_probe.hpp"

#include <optional>
#include <string>
#include <vector>

namespace menupilot::vision {

struct ClickAttemptStats {
    int attempts = 0;
    int fallback_keys = 0;
    std::string matched_template;   // 空 = 未クリック
    std::optional<Point> clicked_at;
    bool stopped = false;           // 停止要求で打ち切った
};

class ClickOrchestrator {
public:
    // bus, stop は nullable
    ClickOrchestrator(MatchProbe& probe, input::InputInjector& injector, Clock& clock,
                      const config::VisionConfig& vision, std::string fallback_key,
                      const StopToken* stop = nullptr, EventBus* bus = nullptr);

    // @param template_ids  先頭が本命、以降は代替画像
    // @param retries       試行回数 (>=1)
    // @param timeout_sec   プローブ1回あたりの timeout 上書き
    bool findAndClick(const std::vector<std::string>& template_ids, int retries,
                      Point click_offset = {}, std::optional<double> timeout_sec = std::nullopt);

    bool pressFallbackKey();

    // 直近の findAndClick の内訳（ログ・テスト用）
    const ClickAttemptStats& lastStats() const { return last_; }

    const config::VisionConfig& visionConfig() const { return vision_; }
    const std::string& fallbackKey() const { return fallback_key_; }

private:
    bool clickAt(const std::string& template_id, Point target);

    MatchProbe& probe_;
    input::InputInjector& injector_;
    Clock& clock_;
    config::VisionConfig vision_;
    std::string fallback_key_;
    const StopToken* stop_;
    EventBus* bus_;
    ClickAttemptStats last_;
};

} // namespace menupilot::vision
