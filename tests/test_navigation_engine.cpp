// =============================================================================
// Unit tests for NavigationEngine (src/nav/navigation_engine.hpp)
// 仮想時計上で実行ループ・スタック検出・停止・統計を検証
// =============================================================================
#include <gtest/gtest.h>
#include <stdexcept>
#include <utility>
#include <vector>
#include "nav/navigation_engine.hpp"
#include "nav/state_graph.hpp"
#include "test_fakes.hpp"

using namespace menupilot;
using namespace menupilot::nav;
using mptest::ServiceRig;

namespace {

config::AppConfig engineConfig() {
    config::AppConfig c = ServiceRig::fastConfig();
    c.state_machine.max_stop_count = 5;
    c.state_machine.break_count = 8;
    c.state_machine.state_transition_delay_sec = 0.0;
    c.state_machine.nudge_pause_sec = 2.0;
    return c;
}

// 常に next へ遷移する状態
std::unique_ptr<State> hop(const std::string& id, const std::string& next) {
    return std::make_unique<FunctionState>(id, id, [next](StateContext&) {
        return StepResult{next, TransitionOutcome::Success, {}};
    });
}

class NavigationEngineTest : public ::testing::Test {
protected:
    NavigationEngineTest()
        : rig(engineConfig()),
          engine(EngineServices{rig.probe, rig.clicker, rig.injector, rig.clock, rig.stop, &rig.bus},
                 rig.cfg) {}

    ServiceRig rig;
    NavigationEngine engine;
};

} // namespace

// ---------------------------------------------------------------------------
// A ⇄ B の往復: 再訪 5 回目で nudge 1 回、8 回目で Aborted
// ---------------------------------------------------------------------------
TEST_F(NavigationEngineTest, StuckLoopNudgesOnceThenAborts) {
    engine.registerState(hop("A", "B"));
    engine.registerState(hop("B", "A"));

    std::vector<std::pair<int, bool>> stuck_events;
    auto sub = rig.bus.subscribe<StuckLoopEvent>([&](const StuckLoopEvent& e) {
        stuck_events.emplace_back(e.repeat_count, e.aborted);
    });

    auto r = engine.run(std::string("A"));
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    const RunReport& report = r.value();

    EXPECT_EQ(report.outcome, RunOutcome::Aborted);
    EXPECT_EQ(report.reason, StopReason::StuckLoop);
    EXPECT_EQ(report.nudges, 1);
    EXPECT_EQ(rig.injector.keys, (std::vector<std::string>{"esc"}));
    // A, B (初回) + 再訪 8 回
    EXPECT_EQ(report.iterations, 10);
    EXPECT_EQ(engine.repeatCounter(), 8);
    EXPECT_EQ(stuck_events, (std::vector<std::pair<int, bool>>{{5, false}, {8, true}}));
    // 中断したイテレーションでは状態を実行しない
    EXPECT_EQ(engine.telemetry().totalTransitions(), 9);
    EXPECT_FALSE(engine.isRunning());
}

// ---------------------------------------------------------------------------
// 既定グラフ: start_menu から 6 遷移 + 終端状態自身の実行 = 7 Transition
// ---------------------------------------------------------------------------
TEST_F(NavigationEngineTest, DefaultGraphReachesTerminal) {
    const char* images[] = {"btn_solo.png", "btn_solo2.png", "btn_train.png", "btn_challenge.png",
                            "btn_play.png", "btn_level.png", "train_menu.png"};
    uint8_t key = 1;
    for (const char* img : images) {
        rig.addTemplate(img, key);
        rig.scorer.script(key, {0.9f});
        key++;
    }
    for (auto& s : buildDefaultStates()) engine.registerState(std::move(s));

    auto r = engine.run(std::string("start_menu"));
    ASSERT_TRUE(r.is_ok());

    EXPECT_EQ(r.value().outcome, RunOutcome::Completed);
    EXPECT_EQ(r.value().reason, StopReason::ReachedTerminal);
    EXPECT_FALSE(r.value().final_state.has_value());
    EXPECT_EQ(r.value().last_executed.value_or(""), "play_menu");
    EXPECT_EQ(rig.injector.clicks, 6);

    auto snap = engine.telemetry().snapshot();
    EXPECT_EQ(snap.total_transitions, 7);
    EXPECT_EQ(snap.successful_transitions, 7);
    EXPECT_DOUBLE_EQ(snap.success_rate, 1.0);
    EXPECT_FALSE(snap.current_state.has_value());
    EXPECT_EQ(snap.history.back().outcome, TransitionOutcome::Terminated);
}

TEST_F(NavigationEngineTest, RecoveryStateReorientsIntoGraph) {
    const char* images[] = {"btn_solo.png", "btn_train.png", "btn_challenge.png",
                            "btn_play.png", "btn_level.png"};
    uint8_t key = 1;
    for (const char* img : images) {
        rig.addTemplate(img, key);
        rig.scorer.script(key, {0.9f});
        key++;
    }
    for (auto& s : buildDefaultStates()) engine.registerState(std::move(s));

    auto r = engine.run();   // initial_state = undefined_menu
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().outcome, RunOutcome::Completed);
    EXPECT_EQ(r.value().iterations, 8);

    auto history = engine.telemetry().snapshot().history;
    ASSERT_FALSE(history.empty());
    EXPECT_EQ(history.front().from_state, "undefined_menu");
    EXPECT_EQ(history.front().to_state.value_or(""), "start_menu");
}

// ---------------------------------------------------------------------------
// イテレーション上限 3、5 ホップ必要 → Interrupted、current は残る
// ---------------------------------------------------------------------------
TEST_F(NavigationEngineTest, IterationBudgetInterrupts) {
    engine.registerState(hop("s0", "s1"));
    engine.registerState(hop("s1", "s2"));
    engine.registerState(hop("s2", "s3"));
    engine.registerState(hop("s3", "s4"));
    engine.registerState(hop("s4", "s5"));
    engine.registerState(std::make_unique<TerminalState>("s5", "end"));

    auto r = engine.run(std::string("s0"), 3);
    ASSERT_TRUE(r.is_ok());

    EXPECT_EQ(r.value().outcome, RunOutcome::Interrupted);
    EXPECT_EQ(r.value().reason, StopReason::IterationBudget);
    EXPECT_EQ(r.value().iterations, 3);
    EXPECT_EQ(r.value().final_state.value_or(""), "s3");
    EXPECT_EQ(engine.currentState().value_or(""), "s3");
}

// ---------------------------------------------------------------------------
// repeat_counter: 再訪で増え、未訪問状態に入るとリセット
// ---------------------------------------------------------------------------
TEST_F(NavigationEngineTest, RepeatCounterResetsOnFreshState) {
    std::vector<int> seen;
    int a_visits = 0;
    engine.registerState(std::make_unique<FunctionState>("A", "", [&](StateContext&) {
        seen.push_back(engine.repeatCounter());
        return StepResult{std::string(++a_visits == 1 ? "B" : "C"), TransitionOutcome::Success, {}};
    }));
    engine.registerState(std::make_unique<FunctionState>("B", "", [&](StateContext&) {
        seen.push_back(engine.repeatCounter());
        return StepResult{std::string("A"), TransitionOutcome::Success, {}};
    }));
    engine.registerState(std::make_unique<FunctionState>("C", "", [&](StateContext&) {
        seen.push_back(engine.repeatCounter());
        return StepResult{std::nullopt, TransitionOutcome::Terminated, {}};
    }));

    auto r = engine.run(std::string("A"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(seen, (std::vector<int>{0, 0, 1, 0}));
    EXPECT_EQ(r.value().outcome, RunOutcome::Completed);
}

// ---------------------------------------------------------------------------
// レジストリ
// ---------------------------------------------------------------------------
TEST_F(NavigationEngineTest, RegisterOverwritesDuplicate) {
    EXPECT_TRUE(engine.registerState(std::make_unique<TerminalState>("A", "first")));
    EXPECT_TRUE(engine.registerState(std::make_unique<TerminalState>("B", "b")));
    EXPECT_TRUE(engine.registerState(std::make_unique<TerminalState>("A", "second")));

    EXPECT_EQ(engine.listStates(), (std::vector<std::string>{"A", "B"}));
    ASSERT_NE(engine.getState("A"), nullptr);
    EXPECT_EQ(engine.getState("A")->description(), "second");
    EXPECT_FALSE(engine.registerState(nullptr));
}

TEST_F(NavigationEngineTest, UnregisterReportsExistence) {
    engine.registerState(std::make_unique<TerminalState>("A", ""));
    EXPECT_TRUE(engine.unregisterState("A"));
    EXPECT_FALSE(engine.unregisterState("A"));
    EXPECT_EQ(engine.getState("A"), nullptr);
    EXPECT_TRUE(engine.listStates().empty());
}

// ---------------------------------------------------------------------------
// 状態内の例外は onError 経由で回復先へ（ループは止まらない）
// ---------------------------------------------------------------------------
TEST_F(NavigationEngineTest, ExceptionRoutedThroughOnError) {
    engine.registerState(std::make_unique<FunctionState>("A", "", [](StateContext&) -> StepResult {
        throw std::runtime_error("screen vanished");
    }));
    engine.registerState(hop("undefined_menu", "done"));
    engine.registerState(std::make_unique<TerminalState>("done", ""));

    auto r = engine.run(std::string("A"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().outcome, RunOutcome::Completed);

    auto snap = engine.telemetry().snapshot();
    ASSERT_EQ(snap.history.size(), 3u);
    EXPECT_EQ(snap.history[0].outcome, TransitionOutcome::Failed);
    EXPECT_EQ(snap.history[0].to_state.value_or(""), "undefined_menu");
    EXPECT_EQ(snap.history[0].error_detail, "screen vanished");
    EXPECT_EQ(snap.states.at("A").failure_count, 1);
}

TEST_F(NavigationEngineTest, NonStandardThrowRoutedThroughOnError) {
    engine.registerState(std::make_unique<FunctionState>("A", "", [](StateContext&) -> StepResult {
        throw 42;
    }));
    engine.registerState(hop("undefined_menu", "done"));
    engine.registerState(std::make_unique<TerminalState>("done", ""));

    auto r = engine.run(std::string("A"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().outcome, RunOutcome::Completed);
    EXPECT_FALSE(engine.isRunning());

    auto snap = engine.telemetry().snapshot();
    ASSERT_EQ(snap.history.size(), 3u);
    EXPECT_EQ(snap.history[0].outcome, TransitionOutcome::Failed);
    EXPECT_EQ(snap.history[0].to_state.value_or(""), "undefined_menu");
    EXPECT_NE(snap.history[0].error_detail.find("non-standard exception"), std::string::npos);
}

namespace {

class SafeRoutingState : public TerminalState {
public:
    explicit SafeRoutingState(std::string id) : TerminalState(std::move(id), "") {}
    StepResult execute(StateContext&) override { throw std::logic_error("bad"); }
    std::string onError(const std::exception&) override { return "safe"; }
};

class GuardedState : public TerminalState {
public:
    explicit GuardedState(std::string id) : TerminalState(std::move(id), "") {}
    bool canEnterFrom(const std::string& previous) const override { return previous != "A"; }
};

} // namespace

TEST_F(NavigationEngineTest, CustomOnErrorChoosesRecovery) {
    engine.registerState(std::make_unique<SafeRoutingState>("A"));
    engine.registerState(std::make_unique<TerminalState>("safe", ""));

    auto r = engine.run(std::string("A"));
    ASSERT_TRUE(r.is_ok());
    auto history = engine.telemetry().snapshot().history;
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].to_state.value_or(""), "safe");
}

TEST_F(NavigationEngineTest, RefusedEntryRoutesThroughOnError) {
    engine.registerState(hop("A", "G"));
    engine.registerState(std::make_unique<GuardedState>("G"));
    engine.registerState(std::make_unique<TerminalState>("undefined_menu", ""));

    auto r = engine.run(std::string("A"));
    ASSERT_TRUE(r.is_ok());
    auto history = engine.telemetry().snapshot().history;
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[1].from_state, "G");
    EXPECT_EQ(history[1].outcome, TransitionOutcome::Failed);
    EXPECT_EQ(history[1].to_state.value_or(""), "undefined_menu");
}

TEST_F(NavigationEngineTest, UnknownStateIsFailedDeadEnd) {
    engine.registerState(hop("A", "ghost"));

    auto r = engine.run(std::string("A"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().outcome, RunOutcome::Completed);
    EXPECT_EQ(r.value().reason, StopReason::DeadEnd);

    auto history = engine.telemetry().snapshot().history;
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[1].from_state, "ghost");
    EXPECT_EQ(history[1].outcome, TransitionOutcome::Failed);
    EXPECT_FALSE(history[1].to_state.has_value());
    EXPECT_NE(history[1].error_detail.find("unknown state"), std::string::npos);
}

// ---------------------------------------------------------------------------
// 停止要求 / 多重実行 / 設定不正
// ---------------------------------------------------------------------------
TEST_F(NavigationEngineTest, StopRequestTakesEffectAtNextIteration) {
    engine.registerState(std::make_unique<FunctionState>("A", "", [&](StateContext&) {
        engine.stop();
        return StepResult{std::string("B"), TransitionOutcome::Success, {}};
    }));
    engine.registerState(hop("B", "A"));

    auto r = engine.run(std::string("A"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().outcome, RunOutcome::Aborted);
    EXPECT_EQ(r.value().reason, StopReason::StopRequested);
    EXPECT_EQ(r.value().iterations, 1);
    EXPECT_EQ(r.value().final_state.value_or(""), "B");
    // 実行中の状態は中断されず、Transition は記録される
    EXPECT_EQ(engine.telemetry().totalTransitions(), 1);
}

// 実行前の停止要求（Ctrl+C 等）は run() で消えない
TEST_F(NavigationEngineTest, PendingStopAbortsBeforeFirstIteration) {
    engine.registerState(hop("A", "T"));
    engine.registerState(std::make_unique<TerminalState>("T", ""));
    rig.stop.request();

    auto r = engine.run(std::string("A"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().outcome, RunOutcome::Aborted);
    EXPECT_EQ(r.value().reason, StopReason::StopRequested);
    EXPECT_EQ(r.value().iterations, 0);
    EXPECT_EQ(engine.telemetry().totalTransitions(), 0);

    rig.stop.reset();
    auto again = engine.run(std::string("A"));
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().outcome, RunOutcome::Completed);
    EXPECT_EQ(again.value().iterations, 2);
}

TEST_F(NavigationEngineTest, OverlappingRunRejected) {
    std::optional<Result<RunReport>> nested;
    bool nested_register = true;
    engine.registerState(std::make_unique<FunctionState>("A", "", [&](StateContext&) {
        nested.emplace(engine.run(std::string("A")));
        nested_register = engine.registerState(std::make_unique<TerminalState>("X", ""));
        return StepResult{std::nullopt, TransitionOutcome::Terminated, {}};
    }));

    auto r = engine.run(std::string("A"));
    ASSERT_TRUE(r.is_ok());
    ASSERT_TRUE(nested.has_value());
    ASSERT_TRUE(nested->is_err());
    EXPECT_EQ(nested->error().message, "already running");
    EXPECT_FALSE(nested_register);
    EXPECT_EQ(engine.telemetry().totalTransitions(), 1);
}

TEST(NavigationEngineConfigTest, InvalidConfigRefusesToStart) {
    config::AppConfig cfg = engineConfig();
    cfg.state_machine.break_count = cfg.state_machine.max_stop_count;
    ServiceRig rig(cfg);
    NavigationEngine engine(EngineServices{rig.probe, rig.clicker, rig.injector, rig.clock, rig.stop, &rig.bus},
                            cfg);
    engine.registerState(std::make_unique<TerminalState>("undefined_menu", ""));

    auto r = engine.run();
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error().message.find("break_count"), std::string::npos);
    EXPECT_FALSE(engine.isRunning());
    EXPECT_EQ(engine.telemetry().totalTransitions(), 0);
}

TEST_F(NavigationEngineTest, ZeroIterationBudgetRejected) {
    engine.registerState(std::make_unique<TerminalState>("A", ""));
    EXPECT_TRUE(engine.run(std::string("A"), 0).is_err());
}

// ---------------------------------------------------------------------------
// 履歴は run() をまたいで保持、clearHistory で消去
// ---------------------------------------------------------------------------
TEST_F(NavigationEngineTest, HistoryPersistsAcrossRuns) {
    engine.registerState(hop("A", "T"));
    engine.registerState(std::make_unique<TerminalState>("T", ""));

    ASSERT_TRUE(engine.run(std::string("A")).is_ok());
    ASSERT_TRUE(engine.run(std::string("A")).is_ok());
    EXPECT_EQ(engine.telemetry().totalTransitions(), 4);
    EXPECT_EQ(engine.telemetry().stateStats("A")->execution_count, 2);

    engine.clearHistory();
    EXPECT_EQ(engine.telemetry().totalTransitions(), 0);
    EXPECT_DOUBLE_EQ(engine.telemetry().successRate(), 0.0);
}

TEST_F(NavigationEngineTest, TransitionDelayUsesClock) {
    config::AppConfig cfg = engineConfig();
    cfg.state_machine.state_transition_delay_sec = 0.25;
    ServiceRig local(cfg);
    NavigationEngine e(EngineServices{local.probe, local.clicker, local.injector, local.clock, local.stop, nullptr},
                       cfg);
    e.registerState(hop("A", "B"));
    e.registerState(hop("B", "T"));
    e.registerState(std::make_unique<TerminalState>("T", ""));

    ASSERT_TRUE(e.run(std::string("A")).is_ok());
    // 後続がある遷移の後だけ待つ
    EXPECT_EQ(local.clock.sleeps, (std::vector<double>{0.25, 0.25}));
}

TEST_F(NavigationEngineTest, PublishesRunEvents) {
    std::vector<std::string> entered;
    int transitions = 0, finished = 0;
    auto s1 = rig.bus.subscribe<StateEnteredEvent>([&](const StateEnteredEvent& e) {
        entered.push_back(e.state_id);
    });
    auto s2 = rig.bus.subscribe<TransitionEvent>([&](const TransitionEvent&) { transitions++; });
    auto s3 = rig.bus.subscribe<RunFinishedEvent>([&](const RunFinishedEvent& e) {
        finished++;
        EXPECT_EQ(e.outcome, static_cast<int>(RunOutcome::Completed));
    });
    engine.registerState(hop("A", "T"));
    engine.registerState(std::make_unique<TerminalState>("T", ""));

    ASSERT_TRUE(engine.run(std::string("A")).is_ok());
    EXPECT_EQ(entered, (std::vector<std::string>{"A", "T"}));
    EXPECT_EQ(transitions, 2);
    EXPECT_EQ(finished, 1);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
