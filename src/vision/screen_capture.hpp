#pragma once
// =============================================================================
// ScreenCapture - 画面スナップショット提供 (Gray8)
// =============================================================================
#include "adb_runner.hpp"
#include "result.hpp"
#include "vision/gray_image.hpp"

namespace menupilot::vision {

class ScreenCapture {
public:
    virtual ~ScreenCapture() = default;
    virtual Result<GrayImage> capture() = 0;
};

// `adb exec-out screencap -p` → PNG → Gray8
class AdbScreenCapture : public ScreenCapture {
public:
    explicit AdbScreenCapture(AdbExecutor executor);

    Result<GrayImage> capture() override;

    uint64_t captureCount() const { return capture_count_; }

private:
    AdbExecutor executor_;
    uint64_t capture_count_ = 0;
};

} // namespace menupilot::vision
