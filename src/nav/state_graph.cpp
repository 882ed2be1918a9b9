// =============================================================================
// State graph 実装
// =============================================================================
#include "nav/state_graph.hpp"
#include "menupilot_log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <sstream>

static constexpr const char* TAG = "graph";

namespace menupilot::nav {

UndefinedRecoveryState::RecoveryTable defaultRecoveryTable() {
    return {
        {"btn_solo.png",   "start_menu"},
        {"btn_train.png",  "solo_menu"},
        {"train_menu.png", "train_menu"},
    };
}

StateList buildDefaultStates() {
    StateList states;
    states.push_back(std::make_unique<UndefinedRecoveryState>(defaultRecoveryTable()));
    states.push_back(std::make_unique<ImageTransitionState>(
        "start_menu", "スタートメニュー", "btn_solo.png", "solo_menu",
        std::vector<std::string>{"btn_solo2.png"}));
    states.push_back(std::make_unique<ImageTransitionState>(
        "solo_menu", "ソロメニュー", "btn_train.png", "train_menu"));
    states.push_back(std::make_unique<ImageTransitionState>(
        "train_menu", "トレーニングメニュー", "btn_challenge.png", "challenge_menu"));
    states.push_back(std::make_unique<ImageTransitionState>(
        "challenge_menu", "チャレンジメニュー", "btn_play.png", "sp_challenge_menu"));
    states.push_back(std::make_unique<ImageTransitionState>(
        "sp_challenge_menu", "スペシャルチャレンジメニュー", "btn_level.png", "level_menu"));
    states.push_back(std::make_unique<ImageTransitionState>(
        "level_menu", "レベル選択メニュー", "btn_play.png", "play_menu"));
    states.push_back(std::make_unique<TerminalState>("play_menu", "プレイ中"));
    return states;
}

namespace {

Result<std::unique_ptr<State>> stateFromJson(const nlohmann::json& j, size_t index) {
    const std::string where = "states[" + std::to_string(index) + "]";
    if (!j.is_object()) return Err<std::unique_ptr<State>>(where + ": must be an object");

    std::string id = j.value("id", "");
    if (id.empty()) return Err<std::unique_ptr<State>>(where + ": missing \"id\"");

    const std::string type = j.value("type", "image");
    const std::string description = j.value("description", id);

    if (type == "terminal") {
        return Ok(std::unique_ptr<State>(std::make_unique<TerminalState>(id, description)));
    }
    if (type != "image") {
        return Err<std::unique_ptr<State>>(where + " (" + id + "): unknown type \"" + type + "\"");
    }

    std::string target = j.value("target", "");
    std::string next = j.value("next", "");
    if (target.empty() || next.empty()) {
        return Err<std::unique_ptr<State>>(where + " (" + id + "): image state needs \"target\" and \"next\"");
    }

    std::vector<std::string> alternatives = j.value("alternatives", std::vector<std::string>{});

    std::optional<double> timeout;
    if (j.contains("timeout")) {
        double t = j.at("timeout").get<double>();
        if (!(t > 0.0)) return Err<std::unique_ptr<State>>(where + " (" + id + "): timeout must be > 0");
        timeout = t;
    }

    vision::Point offset;
    if (j.contains("offset")) {
        const auto& o = j.at("offset");
        if (!o.is_array() || o.size() != 2) {
            return Err<std::unique_ptr<State>>(where + " (" + id + "): offset must be [x, y]");
        }
        offset = {o[0].get<int>(), o[1].get<int>()};
    }

    return Ok(std::unique_ptr<State>(std::make_unique<ImageTransitionState>(
        id, description, target, next, std::move(alternatives), timeout, offset)));
}

} // namespace

Result<StateList> parseStateGraph(const std::string& json_text) {
    StateList states;
    try {
        nlohmann::json root = nlohmann::json::parse(json_text);
        if (!root.is_object() || !root.contains("states") || !root["states"].is_array()) {
            return Err<StateList>("state graph must be an object with a \"states\" array");
        }

        // onError の既定遷移先なので回復状態は必須
        if (!root.contains("recovery") || !root["recovery"].is_array() || root["recovery"].empty()) {
            return Err<StateList>("state graph needs a non-empty \"recovery\" array");
        }
        UndefinedRecoveryState::RecoveryTable table;
        for (const auto& entry : root["recovery"]) {
            std::string image = entry.is_object() ? entry.value("image", "") : "";
            std::string state = entry.is_object() ? entry.value("state", "") : "";
            if (image.empty() || state.empty()) {
                return Err<StateList>("recovery entries need \"image\" and \"state\"");
            }
            table.emplace_back(image, state);
        }
        states.push_back(std::make_unique<UndefinedRecoveryState>(std::move(table)));

        const auto& arr = root["states"];
        for (size_t i = 0; i < arr.size(); ++i) {
            auto s = stateFromJson(arr[i], i);
            if (s.is_err()) return Err<StateList>(s.error().message);
            states.push_back(std::move(s).value());
        }
    } catch (const nlohmann::json::exception& e) {
        return Err<StateList>(std::string("state graph parse error: ") + e.what());
    }

    // 遷移先が定義済みか確認。ID の重複も不可
    std::set<std::string> ids;
    for (const auto& s : states) {
        if (!ids.insert(s->id()).second) {
            return Err<StateList>("state \"" + s->id() + "\" is defined more than once");
        }
    }
    for (const auto& s : states) {
        if (auto* img = dynamic_cast<const ImageTransitionState*>(s.get())) {
            if (!ids.count(img->nextState())) {
                return Err<StateList>(s->id() + ": next state \"" + img->nextState() + "\" is not defined");
            }
        } else if (auto* rec = dynamic_cast<const UndefinedRecoveryState*>(s.get())) {
            for (const auto& entry : rec->table()) {
                if (!ids.count(entry.second)) {
                    return Err<StateList>("recovery target \"" + entry.second + "\" is not defined");
                }
            }
        }
    }

    MPLOG_INFO(TAG, "状態グラフ: %zu 状態", states.size());
    return Ok(std::move(states));
}

Result<StateList> loadStateGraph(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<StateList>(IoError("state graph not found: " + path, IoError::Kind::NotFound));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto parsed = parseStateGraph(buffer.str());
    if (parsed.is_err()) {
        MPLOG_ERROR(TAG, "%s: %s", path.c_str(), parsed.error().message.c_str());
    }
    return parsed;
}

std::vector<std::string> collectExpectedImages(const StateList& states) {
    std::vector<std::string> images;
    std::set<std::string> seen;
    for (const auto& s : states) {
        for (auto& img : s->expectedImages()) {
            if (seen.insert(img).second) images.push_back(img);
        }
    }
    return images;
}

} // namespace menupilot::nav
