#pragma once
// =============================================================================
// MenuPilot - ADB Command Runner
// =============================================================================
// `adb [-s serial] <args...>` を実行し stdout をバイト列で返す。
// AdbScreenCapture / AdbInputInjector はこの関数型を注入で受け取るため、
// テストではサブプロセスを起動しない。
// =============================================================================
#include "result.hpp"

#include <functional>
#include <string>
#include <vector>

namespace menupilot {

// args: adb 以降の引数（"-s serial" は含まない）。戻り値: stdout（バイナリ可）
using AdbExecutor = std::function<Result<std::string>(const std::vector<std::string>& args)>;

// シリアル / IP:port として安全な文字のみで構成されているか
bool isValidAdbSerial(const std::string& serial);

// 引数1個がシェルに渡して安全か（英数字と - _ . : / , = + のみ）
bool isSafeShellArg(const std::string& arg);

// popen ベースのデフォルト実装
// @param adb_path  adb 実行ファイル (PATH 解決可)
// @param serial    空ならデフォルトデバイス
AdbExecutor makeProcessAdbExecutor(const std::string& adb_path, const std::string& serial);

} // namespace menupilot
