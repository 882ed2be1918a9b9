#pragma once
// =============================================================================
// MatchProbe - キャプチャ + スコアリングのポーリング
// =============================================================================
// timeout 経過まで capture → score → (confidence >= threshold なら成功) → sleep
// を繰り返す。各ポーリングは独立（最大スコアは持ち越さない）。
// テンプレート読込失敗は設定エラー扱いで即 not-found を返す。
// =============================================================================
#include "clock.hpp"
#include "vision/gray_image.hpp"
#include "vision/screen_capture.hpp"
#include "vision/template_scorer.hpp"
#include "vision/template_store.hpp"

#include <optional>
#include <string>

namespace menupilot::vision {

struct MatchResult {
    bool found = false;
    std::optional<Point> position;    // マッチ中心（スクリーン座標）。found の時のみ
    float confidence = 0.0f;          // 最後のポーリングのスコア
    Size template_size;
    double elapsed_sec = 0.0;
    int polls = 0;
};

struct ProbeOptions {
    double timeout_sec = 5.0;
    double poll_interval_sec = 0.5;
    float threshold = 0.8f;
    std::optional<Region> region;     // 指定時はキャプチャをクロップしてから照合
};

class MatchProbe {
public:
    // stop は nullable。立っていればポーリング前に打ち切る
    MatchProbe(ScreenCapture& capture, const TemplateScorer& scorer,
               TemplateStore& store, Clock& clock, const StopToken* stop = nullptr);

    MatchResult probe(const std::string& template_id, const ProbeOptions& options);

    TemplateStore& store() { return store_; }

private:
    ScreenCapture& capture_;
    const TemplateScorer& scorer_;
    TemplateStore& store_;
    Clock& clock_;
    const StopToken* stop_;
};

} // namespace menupilot::vision
