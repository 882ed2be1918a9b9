#pragma once
// =============================================================================
// State graph - 既定のメニュー遷移グラフ / JSON グラフ定義の読込
// =============================================================================
// JSON 形式:
//   {
//     "recovery": [ {"image": "btn_solo.png", "state": "start_menu"}, ... ],
//     "states": [
//       {"id": "start_menu", "type": "image", "target": "btn_solo.png",
//        "alternatives": ["btn_solo2.png"], "next": "solo_menu",
//        "timeout": 3.0, "offset": [0, 0], "description": "..."},
//       {"id": "play_menu", "type": "terminal"}
//     ]
//   }
// "recovery" がある場合は undefined_menu を生成する。
// =============================================================================
#include "nav/state.hpp"
#include "result.hpp"

#include <memory>
#include <string>
#include <vector>

namespace menupilot::nav {

using StateList = std::vector<std::unique_ptr<State>>;

UndefinedRecoveryState::RecoveryTable defaultRecoveryTable();

// undefined_menu → start_menu → ... → play_menu
StateList buildDefaultStates();

Result<StateList> parseStateGraph(const std::string& json_text);
Result<StateList> loadStateGraph(const std::string& path);

// 全状態の expectedImages() を重複なしで列挙（出現順）
std::vector<std::string> collectExpectedImages(const StateList& states);

} // namespace menupilot::nav
