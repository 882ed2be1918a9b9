#pragma once
// =============================================================================
// TemplateScorer - スクリーン中のテンプレート最良位置と信頼度を返す
// =============================================================================
// NccTemplateScorer: 正規化相互相関 (TM_CCOEFF_NORMED 相当, [0,1] にクランプ)。
// ピラミッド縮小画像で粗探索 → 候補周辺をフル解像度で精密化。
// 同一入力に対して決定的。
// =============================================================================
#include "vision/gray_image.hpp"

namespace menupilot::vision {

struct ScoreResult {
    Point top_left;            // テンプレート左上（スクリーン座標）
    float confidence = 0.0f;   // 0.0-1.0
};

class TemplateScorer {
public:
    virtual ~TemplateScorer() = default;
    virtual ScoreResult score(const GrayImage& screen, const GrayImage& tpl) const = 0;
};

struct NccScorerConfig {
    int   pyramid_levels      = 2;    // 0 = 全探索のみ
    int   min_coarse_template = 8;    // 縮小後テンプレートの最小辺
    int   max_candidates      = 8;    // 粗探索から精密化へ渡す候補数
    int   refine_radius       = 4;    // 精密化の探索半径(px, フル解像度)
};

class NccTemplateScorer : public TemplateScorer {
public:
    explicit NccTemplateScorer(const NccScorerConfig& config = {}) : config_(config) {}

    ScoreResult score(const GrayImage& screen, const GrayImage& tpl) const override;

    const NccScorerConfig& config() const { return config_; }

private:
    NccScorerConfig config_;
};

} // namespace menupilot::vision
