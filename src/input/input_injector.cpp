// =============================================================================
// AdbInputInjector - `adb shell input tap/keyevent`
// =============================================================================
#include "input/input_injector.hpp"
#include "menupilot_log.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

static constexpr const char* TAG = "input";

namespace menupilot::input {

std::optional<int> androidKeycode(const std::string& key) {
    static const std::unordered_map<std::string, int> kNamed = {
        {"esc", 111}, {"escape", 111},
        {"back", 4},  {"home", 3},
        {"enter", 66}, {"return", 66},
        {"space", 62}, {"tab", 61},
        {"del", 67},  {"backspace", 67},
        {"up", 19},   {"down", 20}, {"left", 21}, {"right", 22},
        {"menu", 82},
    };

    std::string k = key;
    std::transform(k.begin(), k.end(), k.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    // pynput 表記 "Key.esc" も受け付ける
    if (k.rfind("key.", 0) == 0) k = k.substr(4);

    auto it = kNamed.find(k);
    if (it != kNamed.end()) return it->second;

    if (k.size() == 1) {
        char c = k[0];
        if (c >= '0' && c <= '9') return 7 + (c - '0');     // KEYCODE_0 = 7
        if (c >= 'a' && c <= 'z') return 29 + (c - 'a');    // KEYCODE_A = 29
    }
    return std::nullopt;
}

AdbInputInjector::AdbInputInjector(AdbExecutor executor)
    : executor_(std::move(executor)) {}

bool AdbInputInjector::run(const std::vector<std::string>& args) {
    if (!executor_) {
        MPLOG_ERROR(TAG, "adb executor not set");
        return false;
    }
    auto r = executor_(args);
    if (r.is_err()) {
        MPLOG_ERROR(TAG, "adb input failed: %s", r.error().message.c_str());
        return false;
    }
    return true;
}

bool AdbInputInjector::movePointer(int x, int y, double duration_sec) {
    if (x < 0 || y < 0) {
        MPLOG_WARN(TAG, "movePointer: negative coordinate (%d, %d)", x, y);
        return false;
    }
    (void)duration_sec;
    x_ = x;
    y_ = y;
    has_position_ = true;
    MPLOG_DEBUG(TAG, "pointer -> (%d, %d)", x, y);
    return true;
}

bool AdbInputInjector::click(MouseButton button) {
    if (!has_position_) {
        MPLOG_WARN(TAG, "click: pointer position unknown");
        return false;
    }
    if (button != MouseButton::Left) {
        MPLOG_WARN(TAG, "click: only primary button is supported on touch devices");
        return false;
    }
    bool ok = run({"shell", "input", "tap", std::to_string(x_), std::to_string(y_)});
    if (ok) MPLOG_DEBUG(TAG, "tap (%d, %d)", x_, y_);
    return ok;
}

bool AdbInputInjector::pressKey(const std::string& key, double duration_sec) {
    auto code = androidKeycode(key);
    if (!code) {
        MPLOG_ERROR(TAG, "pressKey: unknown key '%s'", key.c_str());
        return false;
    }
    std::vector<std::string> args = {"shell", "input", "keyevent"};
    if (duration_sec >= 0.5) args.push_back("--longpress");
    args.push_back(std::to_string(*code));
    bool ok = run(args);
    if (ok) MPLOG_DEBUG(TAG, "key %s (keycode=%d)", key.c_str(), *code);
    return ok;
}

} // namespace menupilot::input
