// =============================================================================
// MenuPilot - CLI エントリポイント
// =============================================================================
//   menupilot [--config PATH] [--state ID] [--max-iterations N] [--stats]
//             [--report PATH] [--graph PATH] [--log-level L]
//             [--validate-only] [--interactive] [--version] [--help]
// 終了コード: 0 = 終端状態まで到達（--validate-only は検証成功）、1 = それ以外
// =============================================================================
#include "adb_runner.hpp"
#include "clock.hpp"
#include "config_loader.hpp"
#include "event_bus.hpp"
#include "input/input_injector.hpp"
#include "menupilot_log.hpp"
#include "nav/navigation_engine.hpp"
#include "nav/state_graph.hpp"
#include "vision/click_orchestrator.hpp"
#include "vision/match_probe.hpp"
#include "vision/screen_capture.hpp"
#include "vision/template_scorer.hpp"
#include "vision/template_store.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

static constexpr const char* TAG = "main";
static constexpr const char* kVersion = "1.0.0";

using namespace menupilot;

namespace {

StopToken g_stop;

void onSignal(int) {
    g_stop.request();
}

struct CliOptions {
    std::string config_path = "config.json";
    std::optional<std::string> initial_state;
    std::optional<int> max_iterations;
    std::optional<std::string> log_level;
    std::optional<std::string> report_path;
    std::optional<std::string> graph_path;
    bool show_stats = false;
    bool validate_only = false;
    bool interactive = false;
    bool show_version = false;
    bool show_help = false;
};

void printUsage(const char* argv0) {
    std::printf(
        "Usage: %s [options]\n"
        "  -c, --config PATH        config file (default: config.json)\n"
        "  -s, --state ID           initial state (default: state_machine.initial_state)\n"
        "      --max-iterations N   iteration budget (default: state_machine.max_iterations)\n"
        "      --graph PATH         load the navigation graph from a JSON file\n"
        "      --stats              print statistics after the run\n"
        "      --report PATH        write the run report as JSON\n"
        "      --log-level LEVEL    DEBUG / INFO / WARNING / ERROR / CRITICAL\n"
        "      --validate-only      validate config and environment, then exit\n"
        "  -i, --interactive        interactive mode\n"
        "  -v, --version            print version\n"
        "  -h, --help               this help\n",
        argv0);
}

// 不正な引数は nullopt（エラーメッセージは出力済み）
std::optional<CliOptions> parseArgs(int argc, char* argv[]) {
    CliOptions o;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "%s requires a value\n", name);
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "-c" || arg == "--config") {
            const char* v = need_value("--config");
            if (!v) return std::nullopt;
            o.config_path = v;
        } else if (arg == "-s" || arg == "--state") {
            const char* v = need_value("--state");
            if (!v) return std::nullopt;
            o.initial_state = v;
        } else if (arg == "--max-iterations") {
            const char* v = need_value("--max-iterations");
            if (!v) return std::nullopt;
            char* end = nullptr;
            long n = std::strtol(v, &end, 10);
            if (end == v || *end != '\0' || n < 1 || n > 1000000) {
                std::fprintf(stderr, "--max-iterations: invalid value '%s'\n", v);
                return std::nullopt;
            }
            o.max_iterations = (int)n;
        } else if (arg == "--graph") {
            const char* v = need_value("--graph");
            if (!v) return std::nullopt;
            o.graph_path = v;
        } else if (arg == "--report") {
            const char* v = need_value("--report");
            if (!v) return std::nullopt;
            o.report_path = v;
        } else if (arg == "--log-level") {
            const char* v = need_value("--log-level");
            if (!v) return std::nullopt;
            o.log_level = v;
        } else if (arg == "--stats") {
            o.show_stats = true;
        } else if (arg == "--validate-only") {
            o.validate_only = true;
        } else if (arg == "-i" || arg == "--interactive") {
            o.interactive = true;
        } else if (arg == "-v" || arg == "--version") {
            o.show_version = true;
        } else if (arg == "-h" || arg == "--help") {
            o.show_help = true;
        } else {
            std::fprintf(stderr, "unknown option: %s\n", arg.c_str());
            return std::nullopt;
        }
    }
    return o;
}

// =============================================================================
// 実行環境一式
// =============================================================================

struct App {
    config::AppConfig cfg;
    SteadyClock clock;
    EventBus bus;
    vision::TemplateStore store;
    vision::NccTemplateScorer scorer;
    vision::AdbScreenCapture capture;
    input::AdbInputInjector injector;
    vision::MatchProbe probe;
    vision::ClickOrchestrator clicker;
    nav::NavigationEngine engine;

    explicit App(const config::AppConfig& c)
        : cfg(c),
          store(c.paths.images_dir),
          capture(makeProcessAdbExecutor(c.device.adb_path, c.device.serial)),
          injector(makeProcessAdbExecutor(c.device.adb_path, c.device.serial)),
          probe(capture, scorer, store, clock, &g_stop),
          clicker(probe, injector, clock, c.vision, c.state_machine.fallback_key, &g_stop, &bus),
          engine(nav::EngineServices{probe, clicker, injector, clock, g_stop, &bus}, c) {}
};

// 設定・画像・キャプチャを確認。false = 致命的（設定不正）
bool validateEnvironment(App& app, const nav::StateList& states) {
    bool ok = true;

    auto problems = config::validateConfig(app.cfg, /*check_paths=*/true);
    for (const auto& p : problems) {
        MPLOG_ERROR(TAG, "config: %s", p.c_str());
        ok = false;
    }

    auto missing = app.store.missingTemplates(nav::collectExpectedImages(states));
    for (const auto& m : missing) {
        MPLOG_WARN(TAG, "テンプレート画像なし: %s", app.store.resolvePath(m).c_str());
    }

    auto shot = app.capture.capture();
    if (shot.is_err()) {
        MPLOG_WARN(TAG, "テストキャプチャ失敗: %s", shot.error().message.c_str());
    } else {
        MPLOG_INFO(TAG, "テストキャプチャ OK: %dx%d", shot.value().width, shot.value().height);
    }

    MPLOG_INFO(TAG, "環境検証: %s (missing images=%zu)", ok ? "OK" : "NG", missing.size());
    return ok;
}

bool writeReport(const nav::NavigationEngine& engine, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs) {
        MPLOG_ERROR(TAG, "report を書けない: %s", path.c_str());
        return false;
    }
    ofs << engine.telemetry().toJson() << "\n";
    MPLOG_INFO(TAG, "report: %s", path.c_str());
    return static_cast<bool>(ofs);
}

// 開始状態が未登録なら 1 イテレーション目で DeadEnd になるだけなので事前に弾く
bool checkInitialState(const App& app, const std::string& id) {
    if (app.engine.getState(id)) return true;
    MPLOG_ERROR(TAG, "開始状態 %s は未登録", id.c_str());
    std::fprintf(stderr, "initial state \"%s\" is not registered\n", id.c_str());
    return false;
}

bool runOnce(App& app, const std::optional<std::string>& initial, std::optional<int> max_iterations) {
    auto result = app.engine.run(initial, max_iterations);
    if (result.is_err()) {
        std::fprintf(stderr, "run refused: %s\n", result.error().message.c_str());
        return false;
    }
    const auto& r = result.value();
    std::printf("outcome: %s (%s), iterations=%d, final=%s\n",
                nav::runOutcomeToString(r.outcome), nav::stopReasonToString(r.reason),
                r.iterations, r.final_state ? r.final_state->c_str() : "(none)");
    return r.outcome == nav::RunOutcome::Completed && r.reason == nav::StopReason::ReachedTerminal;
}

void printInteractiveHelp() {
    std::printf(
        "commands:\n"
        "  start [state]  run the navigation (optionally from a state)\n"
        "  status         current state and counters\n"
        "  stats          per-state statistics\n"
        "  states         registered states\n"
        "  config         current configuration\n"
        "  help           this help\n"
        "  quit           exit\n");
}

int interactiveLoop(App& app, std::optional<int> max_iterations) {
    std::printf("MenuPilot %s interactive mode. Type 'help' for commands.\n", kVersion);
    std::string line;
    bool last_ok = true;
    while (true) {
        std::printf("menupilot> ");
        std::fflush(stdout);
        if (!std::getline(std::cin, line)) break;
        if (g_stop.requested()) break;   // プロンプト中の Ctrl+C で終了

        std::istringstream is(line);
        std::string cmd, arg;
        is >> cmd >> arg;
        if (cmd.empty()) continue;

        if (cmd == "quit" || cmd == "exit" || cmd == "q") {
            break;
        } else if (cmd == "start") {
            if (!arg.empty() && !checkInitialState(app, arg)) {
                last_ok = false;
                continue;
            }
            last_ok = runOnce(app, arg.empty() ? std::nullopt : std::optional<std::string>(arg),
                              max_iterations);
            g_stop.reset();   // 実行中の Ctrl+C はその run だけを止める
        } else if (cmd == "status") {
            auto snap = app.engine.telemetry().snapshot();
            std::printf("running=%s current=%s repeat=%d transitions=%d success_rate=%.1f%%\n",
                        snap.running ? "yes" : "no",
                        snap.current_state ? snap.current_state->c_str() : "(none)",
                        snap.repeat_counter, snap.total_transitions, snap.success_rate * 100.0);
        } else if (cmd == "stats") {
            std::printf("%s", app.engine.telemetry().formatReport().c_str());
        } else if (cmd == "states") {
            for (const auto& id : app.engine.listStates()) {
                const auto* s = app.engine.getState(id);
                std::printf("  %-20s %s\n", id.c_str(), s ? s->description().c_str() : "");
            }
        } else if (cmd == "config") {
            std::printf("%s\n", config::describeConfig(app.cfg).c_str());
        } else if (cmd == "help") {
            printInteractiveHelp();
        } else {
            std::printf("unknown command: %s (type 'help')\n", cmd.c_str());
        }
    }
    return last_ok ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = parseArgs(argc, argv);
    if (!parsed) {
        printUsage(argv[0]);
        return 1;
    }
    const CliOptions& opts = *parsed;
    if (opts.show_help) {
        printUsage(argv[0]);
        return 0;
    }
    if (opts.show_version) {
        std::printf("MenuPilot %s\n", kVersion);
        return 0;
    }

    config::AppConfig cfg;
    auto loaded = config::loadConfig(opts.config_path);
    if (loaded.is_ok()) {
        cfg = loaded.value();
    } else if (!std::filesystem::exists(opts.config_path)) {
        MPLOG_WARN(TAG, "%s が無いためデフォルト設定を使用", opts.config_path.c_str());
    } else {
        std::fprintf(stderr, "config error: %s\n", loaded.error().message.c_str());
        return 1;
    }
    if (opts.log_level) cfg.logging.log_level = *opts.log_level;

    auto level = menupilot::log::parseLevel(cfg.logging.log_level);
    if (!level) {
        std::fprintf(stderr, "unknown log level: %s\n", cfg.logging.log_level.c_str());
        return 1;
    }
    menupilot::log::setLogLevel(*level);

    std::error_code ec;
    std::filesystem::create_directories(cfg.paths.logs_dir, ec);
    const std::string log_path = (std::filesystem::path(cfg.paths.logs_dir) / "menupilot.log").string();
    if (ec || !menupilot::log::openLogFile(log_path.c_str())) {
        MPLOG_WARN(TAG, "ログファイルを開けない: %s", log_path.c_str());
    }
    MPLOG_INFO(TAG, "MenuPilot %s 起動 (config=%s)", kVersion, opts.config_path.c_str());

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    nav::StateList states;
    if (opts.graph_path) {
        auto graph = nav::loadStateGraph(*opts.graph_path);
        if (graph.is_err()) {
            std::fprintf(stderr, "graph error: %s\n", graph.error().message.c_str());
            menupilot::log::closeLogFile();
            return 1;
        }
        states = std::move(graph).value();
    } else {
        states = nav::buildDefaultStates();
    }

    App app(cfg);
    auto ev_sub = app.bus.subscribe<StuckLoopEvent>([](const StuckLoopEvent& e) {
        MPLOG_WARN(TAG, "stuck loop at %s (repeat=%d, %s)", e.state_id.c_str(), e.repeat_count,
                   e.aborted ? "abort" : "nudge");
    });

    bool env_ok = validateEnvironment(app, states);
    for (auto& s : states) {
        if (!app.engine.registerState(std::move(s))) {
            MPLOG_ERROR(TAG, "状態登録失敗");
        }
    }
    states.clear();

    const std::string initial = opts.initial_state.value_or(cfg.state_machine.initial_state);
    if (!checkInitialState(app, initial)) env_ok = false;

    if (opts.validate_only) {
        std::printf("validation %s\n", env_ok ? "passed" : "failed");
        menupilot::log::closeLogFile();
        return env_ok ? 0 : 1;
    }
    if (!env_ok) {
        std::fprintf(stderr, "configuration is invalid; see log for details\n");
        menupilot::log::closeLogFile();
        return 1;
    }

    int exit_code = 0;
    if (opts.interactive) {
        exit_code = interactiveLoop(app, opts.max_iterations);
    } else {
        exit_code = runOnce(app, opts.initial_state, opts.max_iterations) ? 0 : 1;
    }

    if (opts.show_stats) {
        std::printf("%s", app.engine.telemetry().formatReport().c_str());
    }
    if (opts.report_path && !writeReport(app.engine, *opts.report_path)) {
        exit_code = 1;
    }

    MPLOG_INFO(TAG, "終了 (exit=%d)", exit_code);
    menupilot::log::closeLogFile();
    return exit_code;
}
