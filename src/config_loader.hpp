#pragma once
// =============================================================================
// MenuPilot Config Loader
// =============================================================================
// Loads settings from config.json with nlohmann/json.
// Sections: vision / state_machine / paths / logging / device.
// Keys missing from the file keep their defaults; unknown keys are ignored.
// =============================================================================

#include <string>
#include <vector>

#include "result.hpp"

namespace menupilot {
namespace config {

struct VisionConfig {
    float  threshold              = 0.80f;  // 0.0-1.0, confidence >= threshold で検出
    double timeout_sec            = 5.0;    // 1回のプローブの最大待ち時間
    double check_interval_sec     = 0.5;    // ポーリング間隔
    int    retries                = 3;      // find_and_click 試行回数
    double delay_between_retries_sec = 2.0;
    double click_duration_sec     = 0.2;    // ポインタ移動時間
    double post_click_delay_sec   = 1.0;
    double recovery_probe_timeout_sec = 1.0; // 復帰状態の画面識別プローブ
};

struct StateMachineConfig {
    std::string initial_state = "undefined_menu";
    int    max_stop_count     = 5;    // この回数の再訪で nudge
    int    break_count        = 8;    // この回数の再訪で中断 (> max_stop_count)
    std::string fallback_key  = "esc";
    double state_transition_delay_sec = 0.1;
    double nudge_pause_sec    = 2.0;
    int    max_iterations     = 100;
};

struct PathConfig {
    std::string images_dir  = "images";
    std::string logs_dir    = "logs";
    std::string config_file = "config.json";
};

struct LogConfig {
    std::string log_level = "INFO";
};

struct DeviceConfig {
    std::string adb_path = "adb";
    std::string serial;            // 空 = adb のデフォルトデバイス
};

struct AppConfig {
    VisionConfig vision;
    StateMachineConfig state_machine;
    PathConfig paths;
    LogConfig logging;
    DeviceConfig device;
};

// @param path  Path to config file
// Missing file → IoError(NotFound). Malformed JSON → Error.
Result<AppConfig> loadConfig(const std::string& path);

// Parse from an in-memory JSON document (same rules as loadConfig)
Result<AppConfig> parseConfig(const std::string& json_text);

Result<void> saveConfig(const AppConfig& config, const std::string& path);

// Itemized list of problems; empty = valid. Never corrects values.
// @param check_paths  Also require paths.images_dir to exist on disk
std::vector<std::string> validateConfig(const AppConfig& config, bool check_paths = false);

// Human-readable dump (interactive "config" command)
std::string describeConfig(const AppConfig& config);

} // namespace config
} // namespace menupilot
