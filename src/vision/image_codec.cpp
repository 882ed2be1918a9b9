// =============================================================================
// 画像デコード - stb_image 実装 (STB_IMAGE_IMPLEMENTATION はこの翻訳単位のみ)
// =============================================================================
#include "vision/image_codec.hpp"
#include "menupilot_log.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

static constexpr const char* TAG = "codec";

namespace menupilot::vision {

namespace {

// stbi が確保したバッファを Gray8 にコピーして解放
GrayImage takeStbi(unsigned char* img, int w, int h, int comp) {
    GrayImage out;
    if (comp == 1) {
        out.width = w;
        out.height = h;
        out.pixels.assign(img, img + (size_t)w * h);
    } else {
        out = grayFromRgba(img, w, h);
    }
    stbi_image_free(img);
    return out;
}

} // namespace

Result<GrayImage> decodeFileToGray(const std::string& path_utf8) {
    int w = 0, h = 0, channels = 0;

    // Gray8として直接読み込み
    if (unsigned char* img = stbi_load(path_utf8.c_str(), &w, &h, &channels, 1)) {
        return Ok(takeStbi(img, w, h, 1));
    }

    // RGBA フォールバック → Gray8変換
    if (unsigned char* img = stbi_load(path_utf8.c_str(), &w, &h, &channels, 4)) {
        MPLOG_DEBUG(TAG, "RGBA->Gray変換: %s %dx%d", path_utf8.c_str(), w, h);
        return Ok(takeStbi(img, w, h, 4));
    }

    const char* reason = stbi_failure_reason();
    std::string err = "stbi_load失敗: " + path_utf8 + " (" + (reason ? reason : "unknown") + ")";
    return Result<GrayImage>(IoError(err, IoError::Kind::DecodeFailed));
}

Result<GrayImage> decodeMemoryToGray(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return Result<GrayImage>(IoError("empty image buffer", IoError::Kind::DecodeFailed));
    }
    int w = 0, h = 0, channels = 0;
    unsigned char* img = stbi_load_from_memory(data, (int)size, &w, &h, &channels, 1);
    if (!img) {
        const char* reason = stbi_failure_reason();
        return Result<GrayImage>(IoError(std::string("stbi_load_from_memory失敗: ") +
                                         (reason ? reason : "unknown"),
                                         IoError::Kind::DecodeFailed));
    }
    return Ok(takeStbi(img, w, h, 1));
}

} // namespace menupilot::vision
