// =============================================================================
// MatchProbe 実装
// =============================================================================
#include "vision/match_probe.hpp"
#include "menupilot_log.hpp"

static constexpr const char* TAG = "probe";

namespace menupilot::vision {

MatchProbe::MatchProbe(ScreenCapture& capture, const TemplateScorer& scorer,
                       TemplateStore& store, Clock& clock, const StopToken* stop)
    : capture_(capture), scorer_(scorer), store_(store), clock_(clock), stop_(stop) {}

MatchResult MatchProbe::probe(const std::string& template_id, const ProbeOptions& options) {
    MatchResult result;

    auto loaded = store_.load(template_id);
    if (loaded.is_err()) {
        MPLOG_ERROR(TAG, "テンプレート読込失敗 %s: %s", template_id.c_str(),
                    loaded.error().message.c_str());
        return result;
    }
    const GrayImage& tpl = loaded.value()->image;
    result.template_size = tpl.size();

    Point offset;
    if (options.region) offset = {options.region->x, options.region->y};

    const auto start = clock_.now();
    const auto timeout = fromSeconds(options.timeout_sec);
    const auto interval = fromSeconds(options.poll_interval_sec);

    while (clock_.now() - start < timeout) {
        if (stop_ && stop_->requested()) {
            MPLOG_INFO(TAG, "%s: 停止要求によりプローブ中断 (polls=%d)", template_id.c_str(), result.polls);
            break;
        }

        auto screen = capture_.capture();
        ++result.polls;
        if (screen.is_err()) {
            // キャプチャ失敗は一時的失敗として次のポーリングへ
            MPLOG_WARN(TAG, "%s: capture失敗 (poll %d): %s", template_id.c_str(), result.polls,
                       screen.error().message.c_str());
        } else {
            GrayImage view = options.region ? screen.value().crop(*options.region)
                                            : std::move(screen.value());
            ScoreResult s = scorer_.score(view, tpl);
            result.confidence = s.confidence;

            if (s.confidence >= options.threshold) {
                result.found = true;
                result.position = Point{s.top_left.x + tpl.width / 2,
                                        s.top_left.y + tpl.height / 2} + offset;
                result.elapsed_sec = toSeconds(clock_.now() - start);
                MPLOG_DEBUG(TAG, "%s 検出 conf=%.3f at (%d,%d) poll=%d elapsed=%.2fs",
                            template_id.c_str(), s.confidence, result.position->x,
                            result.position->y, result.polls, result.elapsed_sec);
                return result;
            }
        }

        clock_.sleepFor(interval);
    }

    result.elapsed_sec = toSeconds(clock_.now() - start);
    MPLOG_DEBUG(TAG, "%s 未検出 (last conf=%.3f, polls=%d, elapsed=%.2fs)",
                template_id.c_str(), result.confidence, result.polls, result.elapsed_sec);
    return result;
}

} // namespace menupilot::vision
