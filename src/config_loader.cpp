// =============================================================================
// MenuPilot Config Loader - nlohmann/json 読み書き + 検証
// =============================================================================
#include "config_loader.hpp"
#include "menupilot_log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

static constexpr const char* TAG = "config";

namespace menupilot {
namespace config {

namespace {

// 型が合わないキーはデフォルトで埋めずに problems へ積む
template<typename T> bool typeMatches(const nlohmann::json& v);
template<> bool typeMatches<int>(const nlohmann::json& v) { return v.is_number_integer(); }
template<> bool typeMatches<float>(const nlohmann::json& v) { return v.is_number(); }
template<> bool typeMatches<double>(const nlohmann::json& v) { return v.is_number(); }
template<> bool typeMatches<std::string>(const nlohmann::json& v) { return v.is_string(); }

template<typename T> const char* typeName();
template<> const char* typeName<int>() { return "integer"; }
template<> const char* typeName<float>() { return "number"; }
template<> const char* typeName<double>() { return "number"; }
template<> const char* typeName<std::string>() { return "string"; }

template<typename T>
void jsonGet(const nlohmann::json& j, const std::string& section, const std::string& key,
             T& out, std::vector<std::string>& problems) {
    if (!j.contains(section)) return;
    const auto& sec = j[section];
    if (!sec.is_object()) return;   // セクション自体の型は fromJson で報告
    if (!sec.contains(key)) return;

    const auto& v = sec[key];
    if (!typeMatches<T>(v)) {
        problems.push_back(section + "." + key + ": expected " + typeName<T>() + ", got " + v.type_name());
        return;
    }
    out = v.get<T>();
}

AppConfig fromJson(const nlohmann::json& j, std::vector<std::string>& problems) {
    AppConfig c;

    for (const char* section : {"vision", "state_machine", "paths", "logging", "device"}) {
        if (j.contains(section) && !j[section].is_object()) {
            problems.push_back(std::string(section) + ": expected object, got " + j[section].type_name());
        }
    }

    jsonGet<float>(j, "vision", "threshold", c.vision.threshold, problems);
    jsonGet<double>(j, "vision", "timeout", c.vision.timeout_sec, problems);
    jsonGet<double>(j, "vision", "check_interval", c.vision.check_interval_sec, problems);
    jsonGet<int>(j, "vision", "retries", c.vision.retries, problems);
    jsonGet<double>(j, "vision", "delay_between_retries", c.vision.delay_between_retries_sec, problems);
    jsonGet<double>(j, "vision", "click_duration", c.vision.click_duration_sec, problems);
    jsonGet<double>(j, "vision", "post_click_delay", c.vision.post_click_delay_sec, problems);
    jsonGet<double>(j, "vision", "recovery_probe_timeout", c.vision.recovery_probe_timeout_sec, problems);

    jsonGet<std::string>(j, "state_machine", "initial_state", c.state_machine.initial_state, problems);
    jsonGet<int>(j, "state_machine", "max_stop_count", c.state_machine.max_stop_count, problems);
    jsonGet<int>(j, "state_machine", "break_count", c.state_machine.break_count, problems);
    jsonGet<std::string>(j, "state_machine", "fallback_key", c.state_machine.fallback_key, problems);
    jsonGet<double>(j, "state_machine", "state_transition_delay", c.state_machine.state_transition_delay_sec, problems);
    jsonGet<double>(j, "state_machine", "nudge_pause", c.state_machine.nudge_pause_sec, problems);
    jsonGet<int>(j, "state_machine", "max_iterations", c.state_machine.max_iterations, problems);

    jsonGet<std::string>(j, "paths", "images_dir", c.paths.images_dir, problems);
    jsonGet<std::string>(j, "paths", "logs_dir", c.paths.logs_dir, problems);
    jsonGet<std::string>(j, "paths", "config_file", c.paths.config_file, problems);

    jsonGet<std::string>(j, "logging", "log_level", c.logging.log_level, problems);

    jsonGet<std::string>(j, "device", "adb_path", c.device.adb_path, problems);
    jsonGet<std::string>(j, "device", "serial", c.device.serial, problems);
    return c;
}

nlohmann::json toJson(const AppConfig& c) {
    nlohmann::json j;
    j["vision"] = {
        {"threshold", c.vision.threshold},
        {"timeout", c.vision.timeout_sec},
        {"check_interval", c.vision.check_interval_sec},
        {"retries", c.vision.retries},
        {"delay_between_retries", c.vision.delay_between_retries_sec},
        {"click_duration", c.vision.click_duration_sec},
        {"post_click_delay", c.vision.post_click_delay_sec},
        {"recovery_probe_timeout", c.vision.recovery_probe_timeout_sec},
    };
    j["state_machine"] = {
        {"initial_state", c.state_machine.initial_state},
        {"max_stop_count", c.state_machine.max_stop_count},
        {"break_count", c.state_machine.break_count},
        {"fallback_key", c.state_machine.fallback_key},
        {"state_transition_delay", c.state_machine.state_transition_delay_sec},
        {"nudge_pause", c.state_machine.nudge_pause_sec},
        {"max_iterations", c.state_machine.max_iterations},
    };
    j["paths"] = {
        {"images_dir", c.paths.images_dir},
        {"logs_dir", c.paths.logs_dir},
        {"config_file", c.paths.config_file},
    };
    j["logging"] = {{"log_level", c.logging.log_level}};
    j["device"] = {{"adb_path", c.device.adb_path}, {"serial", c.device.serial}};
    return j;
}

} // namespace

Result<AppConfig> parseConfig(const std::string& json_text) {
    try {
        nlohmann::json j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return Err<AppConfig>("config root must be a JSON object");
        }
        std::vector<std::string> problems;
        AppConfig c = fromJson(j, problems);
        if (!problems.empty()) {
            ConfigError err(std::move(problems));
            MPLOG_ERROR(TAG, "%s", err.message.c_str());
            return Result<AppConfig>(Error(err.message));
        }
        return Ok(std::move(c));
    } catch (const nlohmann::json::exception& e) {
        MPLOG_ERROR(TAG, "JSON parse error: %s", e.what());
        return Err<AppConfig>(std::string("JSON parse error: ") + e.what());
    }
}

Result<AppConfig> loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<AppConfig>(IoError("config file not found: " + path, IoError::Kind::NotFound));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto parsed = parseConfig(buffer.str());
    if (parsed.is_ok()) {
        const auto& c = parsed.value();
        MPLOG_INFO(TAG, "Loaded %s: threshold=%.2f timeout=%.1fs initial_state=%s",
                   path.c_str(), c.vision.threshold, c.vision.timeout_sec,
                   c.state_machine.initial_state.c_str());
    }
    return parsed;
}

Result<void> saveConfig(const AppConfig& config, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs) {
        return Result<void>(IoError("cannot open for writing: " + path, IoError::Kind::PermissionDenied));
    }
    ofs << toJson(config).dump(2) << "\n";
    if (!ofs) {
        return Result<void>(IoError("write failed: " + path));
    }
    MPLOG_INFO(TAG, "Saved %s", path.c_str());
    return Ok();
}

std::vector<std::string> validateConfig(const AppConfig& c, bool check_paths) {
    std::vector<std::string> errors;

    if (!(c.vision.threshold >= 0.0f && c.vision.threshold <= 1.0f))
        errors.push_back("vision.threshold must be within [0, 1]");
    if (!(c.vision.timeout_sec > 0.0))
        errors.push_back("vision.timeout must be > 0");
    if (!(c.vision.check_interval_sec > 0.0))
        errors.push_back("vision.check_interval must be > 0");
    if (c.vision.retries < 1)
        errors.push_back("vision.retries must be >= 1");
    if (c.vision.delay_between_retries_sec < 0.0)
        errors.push_back("vision.delay_between_retries must be >= 0");
    if (c.vision.click_duration_sec < 0.0)
        errors.push_back("vision.click_duration must be >= 0");
    if (c.vision.post_click_delay_sec < 0.0)
        errors.push_back("vision.post_click_delay must be >= 0");
    if (!(c.vision.recovery_probe_timeout_sec > 0.0))
        errors.push_back("vision.recovery_probe_timeout must be > 0");

    if (c.state_machine.max_stop_count < 1)
        errors.push_back("state_machine.max_stop_count must be >= 1");
    if (c.state_machine.break_count < 1)
        errors.push_back("state_machine.break_count must be >= 1");
    if (c.state_machine.break_count <= c.state_machine.max_stop_count)
        errors.push_back("state_machine.break_count must be greater than max_stop_count");
    if (c.state_machine.fallback_key.empty())
        errors.push_back("state_machine.fallback_key must not be empty");
    if (c.state_machine.state_transition_delay_sec < 0.0)
        errors.push_back("state_machine.state_transition_delay must be >= 0");
    if (c.state_machine.nudge_pause_sec < 0.0)
        errors.push_back("state_machine.nudge_pause must be >= 0");
    if (c.state_machine.max_iterations < 1)
        errors.push_back("state_machine.max_iterations must be >= 1");

    if (c.paths.images_dir.empty()) {
        errors.push_back("paths.images_dir must not be empty");
    } else if (check_paths) {
        std::error_code ec;
        if (!std::filesystem::is_directory(c.paths.images_dir, ec))
            errors.push_back("paths.images_dir does not exist: " + c.paths.images_dir);
    }

    if (!log::parseLevel(c.logging.log_level))
        errors.push_back("logging.log_level is not a known level: " + c.logging.log_level);

    return errors;
}

std::string describeConfig(const AppConfig& c) {
    return toJson(c).dump(2);
}

} // namespace config
} // namespace menupilot
