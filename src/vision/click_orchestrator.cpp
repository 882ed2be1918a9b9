// =============================================================================
// ClickOrchestrator 実装
// =============================================================================
#include "vision/click_orchestrator.hpp"
#include "menupilot_log.hpp"

static constexpr const char* TAG = "click";

namespace menupilot::vision {

ClickOrchestrator::ClickOrchestrator(MatchProbe& probe, input::InputInjector& injector,
                                     Clock& clock, const config::VisionConfig& vision,
                                     std::string fallback_key, const StopToken* stop,
                                     EventBus* bus)
    : probe_(probe), injector_(injector), clock_(clock), vision_(vision),
      fallback_key_(std::move(fallback_key)), stop_(stop), bus_(bus) {}

bool ClickOrchestrator::pressFallbackKey() {
    bool ok = injector_.pressKey(fallback_key_, 0.1);
    if (!ok) {
        MPLOG_WARN(TAG, "fallback key '%s' rejected", fallback_key_.c_str());
    }
    if (bus_) {
        KeyCommandEvent evt;
        evt.key = fallback_key_;
        evt.ok = ok;
        bus_->publish(evt);
    }
    return ok;
}

bool ClickOrchestrator::clickAt(const std::string& template_id, Point target) {
    bool ok = injector_.movePointer(target.x, target.y, vision_.click_duration_sec) &&
              injector_.click(input::MouseButton::Left);
    if (bus_) {
        TapCommandEvent evt;
        evt.template_id = template_id;
        evt.x = target.x;
        evt.y = target.y;
        evt.ok = ok;
        bus_->publish(evt);
    }
    return ok;
}

bool ClickOrchestrator::findAndClick(const std::vector<std::string>& template_ids, int retries,
                                     Point click_offset, std::optional<double> timeout_sec) {
    last_ = {};
    if (template_ids.empty()) {
        MPLOG_ERROR(TAG, "findAndClick: no template ids");
        return false;
    }

    ProbeOptions opts;
    opts.timeout_sec = timeout_sec.value_or(vision_.timeout_sec);
    opts.poll_interval_sec = vision_.check_interval_sec;
    opts.threshold = vision_.threshold;

    const std::string& primary = template_ids.front();

    for (int attempt = 1; attempt <= retries; ++attempt) {
        if (stop_ && stop_->requested()) {
            MPLOG_INFO(TAG, "%s: 停止要求 (attempt %d/%d)", primary.c_str(), attempt, retries);
            last_.stopped = true;
            return false;
        }
        last_.attempts = attempt;

        bool clicked = false;
        for (const auto& id : template_ids) {
            MatchResult m = probe_.probe(id, opts);
            if (!m.found) continue;

            Point target = *m.position + click_offset;
            if (clickAt(id, target)) {
                MPLOG_INFO(TAG, "%s をクリック (%d,%d) conf=%.3f attempt %d/%d",
                           id.c_str(), target.x, target.y, m.confidence, attempt, retries);
                last_.matched_template = id;
                last_.clicked_at = target;
                clicked = true;
            } else {
                MPLOG_WARN(TAG, "%s: クリック注入失敗 (%d,%d) attempt %d/%d",
                           id.c_str(), target.x, target.y, attempt, retries);
            }
            break;
        }

        if (clicked) {
            clock_.sleepFor(fromSeconds(vision_.post_click_delay_sec));
            return true;
        }

        // ポーリング中の停止: fallback キーも待機もしない
        if (stop_ && stop_->requested()) {
            MPLOG_INFO(TAG, "%s: 停止要求 (attempt %d/%d 中断)", primary.c_str(), attempt, retries);
            last_.stopped = true;
            return false;
        }

        MPLOG_WARN(TAG, "%s: 試行 %d/%d 失敗 → fallback '%s'",
                   primary.c_str(), attempt, retries, fallback_key_.c_str());
        (void)pressFallbackKey();   // 失敗時のログは pressFallbackKey 内
        ++last_.fallback_keys;

        if (attempt < retries) {
            clock_.sleepFor(fromSeconds(vision_.delay_between_retries_sec));
        }
    }

    MPLOG_ERROR(TAG, "%s: %d 回試行しても見つからない", primary.c_str(), retries);
    return false;
}

} // namespace menupilot::vision
