#pragma once
// =============================================================================
// 画像デコード - stb_image で PNG/JPEG/BMP を Gray8 に変換
// =============================================================================
#include "result.hpp"
#include "vision/gray_image.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace menupilot::vision {

// ファイルから Gray8 読み込み（Gray8 直接 → 失敗時 RGBA 経由）
Result<GrayImage> decodeFileToGray(const std::string& path_utf8);

// メモリ上のエンコード済み画像 (adb screencap -p 出力等) を Gray8 に変換
Result<GrayImage> decodeMemoryToGray(const uint8_t* data, size_t size);

} // namespace menupilot::vision
