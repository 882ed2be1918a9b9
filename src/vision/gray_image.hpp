#pragma once
// =============================================================================
// GrayImage - Gray8 ラスタ（スクリーンショット / テンプレート共通）
// =============================================================================
#include <algorithm>
#include <cstdint>
#include <vector>

namespace menupilot::vision {

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
};

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& o) const { return width == o.width && height == o.height; }
};

// 検索領域 (ピクセル座標、左上原点)
struct Region {
    int x = 0, y = 0;
    int width = 0, height = 0;
};

struct GrayImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;   // row-major, stride = width

    GrayImage() = default;
    GrayImage(int w, int h, uint8_t fill = 0)
        : width(w), height(h), pixels((size_t)w * h, fill) {}

    bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
    Size size() const { return {width, height}; }

    uint8_t at(int x, int y) const { return pixels[(size_t)y * width + x]; }
    uint8_t& at(int x, int y) { return pixels[(size_t)y * width + x]; }

    // 画像範囲にクリップして切り出し。範囲外なら空画像
    GrayImage crop(const Region& r) const {
        int x0 = std::clamp(r.x, 0, width);
        int y0 = std::clamp(r.y, 0, height);
        int x1 = std::clamp(r.x + r.width, 0, width);
        int y1 = std::clamp(r.y + r.height, 0, height);
        if (x1 <= x0 || y1 <= y0) return {};

        GrayImage out(x1 - x0, y1 - y0);
        for (int y = y0; y < y1; ++y) {
            std::copy(pixels.begin() + (size_t)y * width + x0,
                      pixels.begin() + (size_t)y * width + x1,
                      out.pixels.begin() + (size_t)(y - y0) * out.width);
        }
        return out;
    }
};

// RGBA → Gray8 変換 (luma近似: 0.299R + 0.587G + 0.114B)
inline uint8_t rgbaToGray(uint8_t r, uint8_t g, uint8_t b) {
    int y = (77 * r + 150 * g + 29 * b + 128) >> 8;
    return (uint8_t)std::clamp(y, 0, 255);
}

inline GrayImage grayFromRgba(const uint8_t* rgba, int w, int h) {
    GrayImage out(w, h);
    for (int i = 0; i < w * h; i++) {
        out.pixels[i] = rgbaToGray(rgba[i * 4 + 0], rgba[i * 4 + 1], rgba[i * 4 + 2]);
    }
    return out;
}

} // namespace menupilot::vision
