#pragma once
// =============================================================================
// InputInjector - ポインタ移動 / クリック / キー入力
// =============================================================================
// 各操作は成功/失敗を bool で返す（失敗はリトライ勘定に畳み込まれる）。
// =============================================================================
#include "adb_runner.hpp"

#include <optional>
#include <string>

namespace menupilot::input {

enum class MouseButton { Left, Right, Middle };

class InputInjector {
public:
    virtual ~InputInjector() = default;

    virtual bool movePointer(int x, int y, double duration_sec) = 0;
    virtual bool click(MouseButton button = MouseButton::Left) = 0;
    virtual bool pressKey(const std::string& key, double duration_sec = 0.1) = 0;
};

// キー名 → Android KEYCODE。未知のキーは nullopt
std::optional<int> androidKeycode(const std::string& key);

// ADB `input` コマンドによる注入。
// movePointer はタッチデバイスにホバーが無いため座標を保持するだけで、
// click でその座標を tap する（duration>0 の長押しは swipe 同座標で代用）。
class AdbInputInjector : public InputInjector {
public:
    explicit AdbInputInjector(AdbExecutor executor);

    bool movePointer(int x, int y, double duration_sec) override;
    bool click(MouseButton button = MouseButton::Left) override;
    bool pressKey(const std::string& key, double duration_sec = 0.1) override;

    int pointerX() const { return x_; }
    int pointerY() const { return y_; }

private:
    bool run(const std::vector<std::string>& args);

    AdbExecutor executor_;
    int x_ = 0;
    int y_ = 0;
    bool has_position_ = false;
};

} // namespace menupilot::input
