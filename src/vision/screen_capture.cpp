// =============================================================================
// AdbScreenCapture - exec-out screencap -p で PNG を取得しデコード
// =============================================================================
#include "vision/screen_capture.hpp"
#include "vision/image_codec.hpp"
#include "menupilot_log.hpp"

static constexpr const char* TAG = "capture";

namespace menupilot::vision {

AdbScreenCapture::AdbScreenCapture(AdbExecutor executor)
    : executor_(std::move(executor)) {}

Result<GrayImage> AdbScreenCapture::capture() {
    if (!executor_) {
        return Err<GrayImage>("adb executor not set");
    }

    auto out = executor_({"exec-out", "screencap", "-p"});
    if (out.is_err()) {
        MPLOG_ERROR(TAG, "screencap失敗: %s", out.error().message.c_str());
        return Err<GrayImage>(out.error().message, out.error().code);
    }

    const std::string& png = out.value();
    auto decoded = decodeMemoryToGray(reinterpret_cast<const uint8_t*>(png.data()), png.size());
    if (decoded.is_err()) {
        MPLOG_ERROR(TAG, "screencapデコード失敗 (%zu bytes): %s", png.size(),
                    decoded.error().message.c_str());
        return decoded;
    }

    ++capture_count_;
    MPLOG_TRACE(TAG, "capture #%llu %dx%d", (unsigned long long)capture_count_,
                decoded.value().width, decoded.value().height);
    return decoded;
}

} // namespace menupilot::vision
