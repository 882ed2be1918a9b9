// =============================================================================
// Unit tests for State variants (src/nav/state.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>
#include "nav/state.hpp"
#include "nav/state_graph.hpp"
#include "test_fakes.hpp"

using namespace menupilot;
using namespace menupilot::nav;
using mptest::ServiceRig;

namespace {

constexpr uint8_t kSolo = 1, kSolo2 = 2, kTrain = 3, kTrainMenu = 4;

class StateTest : public ::testing::Test {
protected:
    void SetUp() override {
        rig.addTemplate("btn_solo.png", kSolo);
        rig.addTemplate("btn_solo2.png", kSolo2);
        rig.addTemplate("btn_train.png", kTrain);
        rig.addTemplate("train_menu.png", kTrainMenu);
    }

    StateContext context() {
        return StateContext{rig.probe, rig.clicker, rig.injector, rig.clock, rig.cfg, &rig.stop};
    }

    ServiceRig rig;
};

} // namespace

// ---------------------------------------------------------------------------
// ImageTransitionState
// ---------------------------------------------------------------------------
TEST_F(StateTest, ImageTransitionSuccessReturnsNextState) {
    rig.scorer.script(kSolo, {0.9f});
    ImageTransitionState s("start_menu", "スタート", "btn_solo.png", "solo_menu", {"btn_solo2.png"});
    auto ctx = context();

    StepResult r = s.execute(ctx);

    ASSERT_TRUE(r.next.has_value());
    EXPECT_EQ(*r.next, "solo_menu");
    EXPECT_EQ(r.outcome, TransitionOutcome::Success);
    EXPECT_EQ(rig.injector.clicks, 1);
}

TEST_F(StateTest, ImageTransitionUsesAlternativeImage) {
    rig.scorer.script(kSolo, {0.2f});
    rig.scorer.script(kSolo2, {0.9f});
    ImageTransitionState s("start_menu", "", "btn_solo.png", "solo_menu", {"btn_solo2.png"});
    auto ctx = context();

    EXPECT_EQ(s.execute(ctx).next.value_or(""), "solo_menu");
    EXPECT_EQ(rig.clicker.lastStats().matched_template, "btn_solo2.png");
}

// 失敗時は回復状態へ自動遷移しない
TEST_F(StateTest, ImageTransitionFailsClosed) {
    rig.scorer.script(kSolo, {0.1f});
    ImageTransitionState s("start_menu", "", "btn_solo.png", "solo_menu");
    auto ctx = context();

    StepResult r = s.execute(ctx);

    EXPECT_FALSE(r.next.has_value());
    EXPECT_EQ(r.outcome, TransitionOutcome::Failed);
    EXPECT_NE(r.detail.find("btn_solo.png"), std::string::npos);
    EXPECT_EQ(rig.injector.keys.size(), (size_t)rig.cfg.vision.retries);
}

TEST_F(StateTest, ImageTransitionTimeoutOverride) {
    rig.scorer.script(kSolo, {0.1f});
    ImageTransitionState s("start_menu", "", "btn_solo.png", "solo_menu", {}, 2.0);
    auto ctx = context();

    (void)s.execute(ctx);

    // 2.0秒 / 0.5秒間隔 = 4 ポーリング × retries 2
    EXPECT_EQ(rig.capture.count, 8);
}

TEST_F(StateTest, ImageTransitionClickOffset) {
    rig.scorer.script(kSolo, {0.9f}, {100, 50});
    ImageTransitionState s("start_menu", "", "btn_solo.png", "solo_menu", {}, std::nullopt, {0, 20});
    auto ctx = context();

    (void)s.execute(ctx);

    ASSERT_EQ(rig.injector.moves.size(), 1u);
    EXPECT_EQ(rig.injector.moves[0], (vision::Point{105, 73}));
}

TEST_F(StateTest, ImageTransitionExpectedImages) {
    ImageTransitionState s("start_menu", "", "btn_solo.png", "solo_menu", {"btn_solo2.png"});
    EXPECT_EQ(s.expectedImages(), (std::vector<std::string>{"btn_solo.png", "btn_solo2.png"}));
}

TEST_F(StateTest, ImageTransitionReportsStopRequest) {
    rig.scorer.script(kSolo, {0.1f});
    rig.capture.on_capture = [&](int) { rig.stop.request(); };
    ImageTransitionState s("start_menu", "", "btn_solo.png", "solo_menu");
    auto ctx = context();

    StepResult r = s.execute(ctx);

    EXPECT_EQ(r.outcome, TransitionOutcome::Failed);
    EXPECT_EQ(r.detail, "stop requested");
    EXPECT_TRUE(rig.injector.keys.empty());
}

// ---------------------------------------------------------------------------
// UndefinedRecoveryState
// ---------------------------------------------------------------------------
TEST_F(StateTest, RecoveryMapsFirstMatchingSignature) {
    rig.scorer.script(kSolo, {0.1f});
    rig.scorer.script(kTrain, {0.95f});
    rig.scorer.script(kTrainMenu, {0.95f});
    UndefinedRecoveryState s(defaultRecoveryTable());
    auto ctx = context();

    StepResult r = s.execute(ctx);

    EXPECT_EQ(r.next.value_or(""), "solo_menu");
    EXPECT_EQ(r.outcome, TransitionOutcome::Success);
    ASSERT_FALSE(rig.injector.moves.empty());
    EXPECT_EQ(rig.injector.moves.front(), (vision::Point{10, 10}));
    EXPECT_TRUE(rig.injector.keys.empty());
    EXPECT_EQ(rig.injector.clicks, 0);
}

TEST_F(StateTest, RecoverySelfLoopsWhenNothingMatches) {
    rig.scorer.script(kSolo, {0.1f});
    rig.scorer.script(kTrain, {0.1f});
    rig.scorer.script(kTrainMenu, {0.1f});
    UndefinedRecoveryState s(defaultRecoveryTable());
    auto ctx = context();

    StepResult r = s.execute(ctx);

    EXPECT_EQ(r.next.value_or(""), kRecoveryStateId);
    EXPECT_EQ(r.outcome, TransitionOutcome::Retry);
    EXPECT_EQ(rig.injector.keys, (std::vector<std::string>{"esc"}));
    // 短いプローブ: 0.5秒 / 0.5秒間隔 = 1 ポーリング × 3 画像
    EXPECT_EQ(rig.capture.count, 3);
    ASSERT_FALSE(rig.clock.sleeps.empty());
    EXPECT_DOUBLE_EQ(rig.clock.sleeps.back(), 1.0);
}

TEST_F(StateTest, RecoveryStopsWithoutFallbackWhenStopRequested) {
    rig.scorer.script(kSolo, {0.1f});
    rig.scorer.script(kTrain, {0.1f});
    rig.scorer.script(kTrainMenu, {0.1f});
    rig.capture.on_capture = [&](int) { rig.stop.request(); };
    UndefinedRecoveryState s(defaultRecoveryTable());
    auto ctx = context();

    StepResult r = s.execute(ctx);

    EXPECT_EQ(r.outcome, TransitionOutcome::Retry);
    EXPECT_EQ(r.detail, "stop requested");
    EXPECT_EQ(rig.capture.count, 1);
    EXPECT_TRUE(rig.injector.keys.empty());
    EXPECT_EQ(std::count(rig.clock.sleeps.begin(), rig.clock.sleeps.end(), 1.0), 0);
}

TEST_F(StateTest, RecoveryExpectedImagesFollowTableOrder) {
    UndefinedRecoveryState s(defaultRecoveryTable());
    EXPECT_EQ(s.id(), "undefined_menu");
    EXPECT_EQ(s.expectedImages(),
              (std::vector<std::string>{"btn_solo.png", "btn_train.png", "train_menu.png"}));
}

// ---------------------------------------------------------------------------
// TerminalState / FunctionState / 既定フック
// ---------------------------------------------------------------------------
TEST_F(StateTest, TerminalHasNoSuccessor) {
    TerminalState s("play_menu", "プレイ中");
    auto ctx = context();

    StepResult r = s.execute(ctx);

    EXPECT_FALSE(r.next.has_value());
    EXPECT_EQ(r.outcome, TransitionOutcome::Terminated);
    EXPECT_EQ(rig.capture.count, 0);
}

TEST_F(StateTest, FunctionStateDelegatesToHandler) {
    int calls = 0;
    FunctionState s("custom", "ユーザー定義",
                    [&](StateContext& c) {
                        calls++;
                        (void)c.injector.pressKey("enter", 0.1);
                        return StepResult{std::string("next"), TransitionOutcome::Success, {}};
                    },
                    {"btn_custom.png"});
    auto ctx = context();

    StepResult r = s.execute(ctx);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(r.next.value_or(""), "next");
    EXPECT_EQ(rig.injector.keys, (std::vector<std::string>{"enter"}));
    EXPECT_EQ(s.expectedImages(), (std::vector<std::string>{"btn_custom.png"}));
}

TEST_F(StateTest, FunctionStateWithoutHandlerFails) {
    FunctionState s("empty", "", nullptr);
    auto ctx = context();
    EXPECT_EQ(s.execute(ctx).outcome, TransitionOutcome::Failed);
}

TEST_F(StateTest, DefaultHooks) {
    TerminalState s("play_menu", "");
    EXPECT_TRUE(s.canEnterFrom("level_menu"));
    EXPECT_TRUE(s.canEnterFrom("anything"));
    EXPECT_EQ(s.onError(std::runtime_error("boom")), "undefined_menu");
    EXPECT_TRUE(s.expectedImages().empty());
}

// ---------------------------------------------------------------------------
// 既定グラフ
// ---------------------------------------------------------------------------
TEST(DefaultGraphTest, BuildsMenuChain) {
    StateList states = buildDefaultStates();
    std::vector<std::string> ids;
    for (const auto& s : states) ids.push_back(s->id());

    EXPECT_EQ(ids, (std::vector<std::string>{"undefined_menu", "start_menu", "solo_menu",
                                             "train_menu", "challenge_menu", "sp_challenge_menu",
                                             "level_menu", "play_menu"}));

    auto* start = dynamic_cast<ImageTransitionState*>(states[1].get());
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(start->targetImage(), "btn_solo.png");
    EXPECT_EQ(start->alternatives(), (std::vector<std::string>{"btn_solo2.png"}));
    EXPECT_EQ(start->nextState(), "solo_menu");
    EXPECT_NE(dynamic_cast<TerminalState*>(states.back().get()), nullptr);

    auto images = collectExpectedImages(states);
    EXPECT_EQ(std::count(images.begin(), images.end(), "btn_play.png"), 1);
    EXPECT_EQ(std::count(images.begin(), images.end(), "btn_solo.png"), 1);
}

TEST(StateGraphTest, ParsesJsonGraph) {
    auto r = parseStateGraph(R"({
        "recovery": [ {"image": "home.png", "state": "home"} ],
        "states": [
            {"id": "home", "target": "btn_go.png", "alternatives": ["btn_go2.png"],
             "next": "done", "timeout": 2.5, "offset": [3, 4]},
            {"id": "done", "type": "terminal", "description": "finished"}
        ]
    })");
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    const StateList& states = r.value();
    ASSERT_EQ(states.size(), 3u);
    EXPECT_EQ(states[0]->id(), "undefined_menu");
    EXPECT_EQ(states[1]->id(), "home");
    EXPECT_EQ(states[2]->description(), "finished");
}

TEST(StateGraphTest, RejectsBrokenGraphs) {
    EXPECT_TRUE(parseStateGraph("{}").is_err());
    EXPECT_TRUE(parseStateGraph("not json").is_err());
    EXPECT_TRUE(parseStateGraph(R"({"recovery": [{"image": "r.png", "state": "a"}], "states": [{"id": "a", "target": "x.png"}]})").is_err());
    EXPECT_TRUE(parseStateGraph(R"({"recovery": [{"image": "r.png", "state": "a"}], "states": [{"id": "a", "type": "teleport"}]})").is_err());
    EXPECT_TRUE(parseStateGraph(R"({"recovery": [{"image": "r.png", "state": "a"}], "states": [{"id": "a", "target": "x.png", "next": "b"}]})").is_err());
    EXPECT_TRUE(parseStateGraph(R"({"recovery": [{"image": "r.png", "state": "a"}], "states": [{"id": "a", "target": "x.png", "next": "a", "timeout": 0}]})").is_err());
    EXPECT_TRUE(parseStateGraph(R"({"recovery": [{"image": "r.png", "state": "ghost"}], "states": [{"id": "a", "type": "terminal"}]})").is_err());
    EXPECT_TRUE(loadStateGraph("__no_such_graph.json").is_err());
}

// 回復状態の無いグラフは onError の遷移先が存在しないので受け付けない
TEST(StateGraphTest, RejectsGraphWithoutRecovery) {
    auto r = parseStateGraph(R"({"states": [
        {"id": "a", "target": "x.png", "next": "done"},
        {"id": "done", "type": "terminal"}
    ]})");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error().message.find("recovery"), std::string::npos);

    EXPECT_TRUE(parseStateGraph(R"({"recovery": [], "states": [{"id": "done", "type": "terminal"}]})").is_err());
    EXPECT_TRUE(parseStateGraph(R"({"recovery": [{"image": "x.png", "state": "done"}],
        "states": [{"id": "done", "type": "terminal"}, {"id": "done", "type": "terminal"}]})").is_err());
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
