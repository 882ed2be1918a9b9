// =============================================================================
// MenuPilot - Result 型
// =============================================================================
// 失敗が「想定内」の呼び出し（テンプレート読込、スクリーンキャプチャ、設定読込、
// run() の実行拒否）は例外ではなく Result<T, E> で返す。
//
//   Result<GrayImage> capture() {
//       if (png.empty()) return Err<GrayImage>("empty screencap output");
//       return Ok(std::move(image));
//   }
//
// is_err() のまま value() を呼ぶのはプログラムの誤りとして BadResultAccess を投げる。
// =============================================================================

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace menupilot {

struct Error {
    std::string message;
    int code = 0;       // 子プロセスの終了コード等。0 = 未設定

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}
};

// ファイル / adb 子プロセス / 画像デコード
struct IoError : Error {
    enum class Kind { NotFound, PermissionDenied, DecodeFailed, Timeout, Other };
    Kind kind = Kind::Other;

    IoError() = default;
    explicit IoError(std::string msg, Kind k = Kind::Other)
        : Error(std::move(msg)), kind(k) {}
};

// validateConfig() の指摘を列挙したまま持ち回る
struct ConfigError : Error {
    std::vector<std::string> problems;

    ConfigError() = default;
    explicit ConfigError(std::vector<std::string> items)
        : Error(join(items)), problems(std::move(items)) {}

private:
    static std::string join(const std::vector<std::string>& items) {
        std::string out = "invalid configuration";
        for (const auto& p : items) out += "\n  - " + p;
        return out;
    }
};

class BadResultAccess : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // E の派生型（IoError → Error 等）も受ける
    template<typename From, typename = std::enable_if_t<std::is_convertible_v<From, E>>>
    Result(From error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return !is_ok(); }
    explicit operator bool() const { return is_ok(); }

    T& value() & { requireOk(); return std::get<0>(data_); }
    const T& value() const& { requireOk(); return std::get<0>(data_); }
    T&& value() && { requireOk(); return std::get<0>(std::move(data_)); }

    E& error() & { requireErr(); return std::get<1>(data_); }
    const E& error() const& { requireErr(); return std::get<1>(data_); }

    T value_or(T fallback) const& { return is_ok() ? std::get<0>(data_) : std::move(fallback); }
    T value_or(T fallback) && { return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback); }

private:
    void requireOk() const {
        if (!is_ok()) throw BadResultAccess("value() on error result: " + std::get<1>(data_).message);
    }
    void requireErr() const {
        if (is_ok()) throw BadResultAccess("error() on ok result");
    }

    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;

    template<typename From, typename = std::enable_if_t<std::is_convertible_v<From, E>>>
    Result(From error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return !is_ok(); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (is_err()) throw BadResultAccess("value() on error result: " + std::get<1>(data_).message);
    }

    const E& error() const {
        if (is_ok()) throw BadResultAccess("error() on ok result");
        return std::get<1>(data_);
    }

private:
    std::variant<std::monostate, E> data_;
};

// -----------------------------------------------------------------------------
// Ok / Err
// -----------------------------------------------------------------------------

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> Ok() { return {}; }

template<typename T, typename E = Error>
Result<T, E> Err(E error) {
    return Result<T, E>(std::move(error));
}

template<typename T>
Result<T> Err(std::string message, int code = 0) {
    return Result<T>(Error(std::move(message), code));
}

template<typename T>
Result<T> Err(const char* message, int code = 0) {
    return Result<T>(Error(message, code));
}

} // namespace menupilot
