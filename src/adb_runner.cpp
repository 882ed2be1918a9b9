// =============================================================================
// MenuPilot - ADB Command Runner Implementation
// =============================================================================
#include "adb_runner.hpp"
#include "menupilot_log.hpp"

#include <cctype>
#include <cstdio>
#include <cstring>
#include <memory>

#ifdef _WIN32
#define popen _popen
#define pclose _pclose
#else
#include <sys/wait.h>
#endif

static constexpr const char* TAG = "adb";

namespace menupilot {

namespace {

constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r";
constexpr size_t MAX_OUTPUT_SIZE = 50 * 1024 * 1024;  // 50MB limit (screencap PNG)
#ifdef _WIN32
constexpr const char* PIPE_MODE = "rb";
#else
constexpr const char* PIPE_MODE = "r";
#endif

} // namespace

bool isValidAdbSerial(const std::string& serial) {
    if (serial.empty() || serial.length() > 64) {
        return false;
    }
    for (char c : serial) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) {
            MPLOG_ERROR(TAG, "Invalid character in device serial: '%c'", c);
            return false;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != ':' && c != '.' && c != '-' && c != '_') {
            MPLOG_WARN(TAG, "Unexpected character in device serial: '%c'", c);
            return false;
        }
    }
    return true;
}

bool isSafeShellArg(const std::string& arg) {
    if (arg.empty()) return false;
    for (char c : arg) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            std::strchr("-_.:/,=+", c) == nullptr) {
            return false;
        }
    }
    return true;
}

AdbExecutor makeProcessAdbExecutor(const std::string& adb_path, const std::string& serial) {
    return [adb_path, serial](const std::vector<std::string>& args) -> Result<std::string> {
        std::string cmd = "\"" + adb_path + "\"";
        if (!serial.empty()) {
            if (!isValidAdbSerial(serial)) {
                return Err<std::string>("invalid adb serial rejected: " + serial);
            }
            cmd += " -s " + serial;
        }
        for (const auto& a : args) {
            if (!isSafeShellArg(a)) {
                return Err<std::string>("unsafe adb argument rejected: " + a);
            }
            cmd += " " + a;
        }

        struct PipeDeleter {
            void operator()(FILE* fp) const { if (fp) pclose(fp); }
        };
        FILE* raw = popen(cmd.c_str(), PIPE_MODE);
        if (!raw) {
            return Result<std::string>(IoError("popen failed: " + cmd, IoError::Kind::Other));
        }
        std::unique_ptr<FILE, PipeDeleter> pipe(raw);

        std::string out;
        char buffer[4096];
        size_t n = 0;
        while ((n = fread(buffer, 1, sizeof(buffer), pipe.get())) > 0) {
            out.append(buffer, n);
            if (out.size() > MAX_OUTPUT_SIZE) {
                MPLOG_WARN(TAG, "adb output exceeds %zu bytes, truncating", MAX_OUTPUT_SIZE);
                break;
            }
        }

        int status = pclose(pipe.release());
#ifndef _WIN32
        if (status != -1 && WIFEXITED(status)) status = WEXITSTATUS(status);
#endif
        if (status != 0) {
            return Err<std::string>("adb exited with status " + std::to_string(status) + ": " + cmd, status);
        }
        return Ok(std::move(out));
    };
}

} // namespace menupilot
