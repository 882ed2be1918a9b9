// =============================================================================
// NccTemplateScorer - CPU 正規化相互相関
// =============================================================================
#include "vision/template_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <vector>

namespace menupilot::vision {

namespace {

// 積分画像 (Σf, Σf²) — ウィンドウ統計を O(1) で取得
struct Integral {
    int w = 0, h = 0;                 // (w+1) x (h+1)
    std::vector<uint64_t> sum;
    std::vector<uint64_t> sq;

    explicit Integral(const GrayImage& img)
        : w(img.width + 1), h(img.height + 1),
          sum((size_t)w * h, 0), sq((size_t)w * h, 0) {
        for (int y = 1; y < h; ++y) {
            uint64_t row = 0, row_sq = 0;
            for (int x = 1; x < w; ++x) {
                uint64_t v = img.at(x - 1, y - 1);
                row += v;
                row_sq += v * v;
                sum[(size_t)y * w + x] = sum[(size_t)(y - 1) * w + x] + row;
                sq[(size_t)y * w + x]  = sq[(size_t)(y - 1) * w + x] + row_sq;
            }
        }
    }

    uint64_t rect(const std::vector<uint64_t>& t, int x, int y, int rw, int rh) const {
        return t[(size_t)(y + rh) * w + (x + rw)] - t[(size_t)y * w + (x + rw)]
             - t[(size_t)(y + rh) * w + x] + t[(size_t)y * w + x];
    }
};

struct TemplateStats {
    double sum = 0, sum_sq = 0;
    double n = 0;
};

TemplateStats statsOf(const GrayImage& tpl) {
    TemplateStats s;
    for (uint8_t v : tpl.pixels) {
        s.sum += v;
        s.sum_sq += (double)v * v;
    }
    s.n = (double)tpl.width * tpl.height;
    return s;
}

float nccAt(const GrayImage& screen, const Integral& integ,
            const GrayImage& tpl, const TemplateStats& ts, int ox, int oy) {
    double sum_f = (double)integ.rect(integ.sum, ox, oy, tpl.width, tpl.height);
    double sum_ff = (double)integ.rect(integ.sq, ox, oy, tpl.width, tpl.height);
    double sum_ft = 0;
    for (int y = 0; y < tpl.height; ++y) {
        const uint8_t* frow = &screen.pixels[(size_t)(oy + y) * screen.width + ox];
        const uint8_t* trow = &tpl.pixels[(size_t)y * tpl.width];
        uint64_t acc = 0;
        for (int x = 0; x < tpl.width; ++x) acc += (uint32_t)frow[x] * trow[x];
        sum_ft += (double)acc;
    }

    const double n = ts.n;
    double mean_f = sum_f / n;
    double mean_t = ts.sum / n;
    double var_f = sum_ff / n - mean_f * mean_f;
    double var_t = ts.sum_sq / n - mean_t * mean_t;

    if (var_f < 1e-6 || var_t < 1e-6) {
        // 分散がほぼゼロ — 両方定数なら完全一致
        return (var_f < 1e-6 && var_t < 1e-6 &&
                std::abs(mean_f - mean_t) < 1.0) ? 1.0f : 0.0f;
    }

    double cov = sum_ft / n - mean_f * mean_t;
    double ncc = cov / std::sqrt(var_f * var_t);
    return std::max(0.0f, std::min(1.0f, (float)ncc));
}

GrayImage downsample2x(const GrayImage& src) {
    GrayImage out(src.width / 2, src.height / 2);
    for (int y = 0; y < out.height; ++y) {
        for (int x = 0; x < out.width; ++x) {
            int s = src.at(2 * x, 2 * y) + src.at(2 * x + 1, 2 * y) +
                    src.at(2 * x, 2 * y + 1) + src.at(2 * x + 1, 2 * y + 1);
            out.at(x, y) = (uint8_t)((s + 2) / 4);
        }
    }
    return out;
}

struct Candidate {
    int x = 0, y = 0;
    float score = 0.0f;
};

// 全探索。上位 max_keep 件を近傍抑制付きで返す（max_keep<=1 なら最良1件）
std::vector<Candidate> exhaustive(const GrayImage& screen, const GrayImage& tpl, int max_keep) {
    Integral integ(screen);
    TemplateStats ts = statsOf(tpl);

    if (max_keep <= 1) {
        Candidate best{0, 0, -1.0f};
        for (int y = 0; y <= screen.height - tpl.height; ++y) {
            for (int x = 0; x <= screen.width - tpl.width; ++x) {
                float s = nccAt(screen, integ, tpl, ts, x, y);
                if (s > best.score) best = {x, y, s};
            }
        }
        return {best};
    }

    std::vector<Candidate> all;
    all.reserve((size_t)(screen.width - tpl.width + 1) * (screen.height - tpl.height + 1));
    for (int y = 0; y <= screen.height - tpl.height; ++y) {
        for (int x = 0; x <= screen.width - tpl.width; ++x) {
            all.push_back({x, y, nccAt(screen, integ, tpl, ts, x, y)});
        }
    }

    // スコア降順、同点は走査順 (y, x) で決定的に
    std::stable_sort(all.begin(), all.end(),
        [](const Candidate& a, const Candidate& b) { return a.score > b.score; });

    std::vector<Candidate> picked;
    for (const auto& c : all) {
        if ((int)picked.size() >= std::max(1, max_keep)) break;
        bool near = std::any_of(picked.begin(), picked.end(), [&](const Candidate& p) {
            return std::abs(p.x - c.x) <= 2 && std::abs(p.y - c.y) <= 2;
        });
        if (!near) picked.push_back(c);
    }
    return picked;
}

} // namespace

ScoreResult NccTemplateScorer::score(const GrayImage& screen, const GrayImage& tpl) const {
    ScoreResult result;
    if (screen.empty() || tpl.empty() ||
        tpl.width > screen.width || tpl.height > screen.height) {
        return result;
    }

    // 縮小後もテンプレートが min_coarse_template 以上を保てる段数
    int levels = 0;
    while (levels < config_.pyramid_levels &&
           (tpl.width >> (levels + 1)) >= config_.min_coarse_template &&
           (tpl.height >> (levels + 1)) >= config_.min_coarse_template) {
        ++levels;
    }

    if (levels == 0) {
        auto best = exhaustive(screen, tpl, 1);
        result.top_left = {best.front().x, best.front().y};
        result.confidence = best.front().score;
        return result;
    }

    GrayImage coarse_screen = screen;
    GrayImage coarse_tpl = tpl;
    for (int i = 0; i < levels; ++i) {
        coarse_screen = downsample2x(coarse_screen);
        coarse_tpl = downsample2x(coarse_tpl);
    }

    auto candidates = exhaustive(coarse_screen, coarse_tpl, config_.max_candidates);

    // フル解像度で候補周辺を精密化
    Integral integ(screen);
    TemplateStats ts = statsOf(tpl);
    const int scale = 1 << levels;
    const int radius = config_.refine_radius + scale;
    const int max_x = screen.width - tpl.width;
    const int max_y = screen.height - tpl.height;

    bool have = false;
    for (const auto& c : candidates) {
        int cx = c.x * scale, cy = c.y * scale;
        for (int y = std::max(0, cy - radius); y <= std::min(max_y, cy + radius); ++y) {
            for (int x = std::max(0, cx - radius); x <= std::min(max_x, cx + radius); ++x) {
                float s = nccAt(screen, integ, tpl, ts, x, y);
                if (!have || s > result.confidence) {
                    result.confidence = s;
                    result.top_left = {x, y};
                    have = true;
                }
            }
        }
    }
    return result;
}

} // namespace menupilot::vision
