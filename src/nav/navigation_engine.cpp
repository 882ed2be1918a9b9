// =============================================================================
// NavigationEngine 実装
// =============================================================================
#include "nav/navigation_engine.hpp"
#include "menupilot_log.hpp"

#include <algorithm>
#include <stdexcept>

static constexpr const char* TAG = "engine";

namespace menupilot::nav {

const char* runOutcomeToString(RunOutcome o) {
    switch (o) {
        case RunOutcome::Completed:   return "Completed";
        case RunOutcome::Aborted:     return "Aborted";
        case RunOutcome::Interrupted: return "Interrupted";
    }
    return "Unknown";
}

const char* stopReasonToString(StopReason r) {
    switch (r) {
        case StopReason::ReachedTerminal: return "reached terminal state";
        case StopReason::DeadEnd:         return "state failed without successor";
        case StopReason::StuckLoop:       return "stuck loop";
        case StopReason::StopRequested:   return "stop requested";
        case StopReason::IterationBudget: return "iteration budget exhausted";
    }
    return "unknown";
}

NavigationEngine::NavigationEngine(EngineServices services, config::AppConfig config)
    : services_(services), config_(std::move(config)) {
    MPLOG_INFO(TAG, "初期化: initial=%s max_stop=%d break=%d fallback=%s",
               config_.state_machine.initial_state.c_str(),
               config_.state_machine.max_stop_count, config_.state_machine.break_count,
               config_.state_machine.fallback_key.c_str());
}

// =============================================================================
// レジストリ
// =============================================================================

bool NavigationEngine::registerState(std::unique_ptr<State> state) {
    if (!state) {
        MPLOG_ERROR(TAG, "registerState: null state");
        return false;
    }
    if (running_.load()) {
        MPLOG_ERROR(TAG, "registerState(%s): 実行中は登録できない", state->id().c_str());
        return false;
    }

    auto it = std::find_if(registry_.begin(), registry_.end(),
                           [&](const std::unique_ptr<State>& s) { return s->id() == state->id(); });
    if (it != registry_.end()) {
        MPLOG_WARN(TAG, "状態 %s は登録済み、上書きする", state->id().c_str());
        *it = std::move(state);
        return true;
    }

    MPLOG_INFO(TAG, "状態登録: %s", state->id().c_str());
    registry_.push_back(std::move(state));
    return true;
}

bool NavigationEngine::unregisterState(const std::string& state_id) {
    if (running_.load()) {
        MPLOG_ERROR(TAG, "unregisterState(%s): 実行中は削除できない", state_id.c_str());
        return false;
    }
    auto it = std::find_if(registry_.begin(), registry_.end(),
                           [&](const std::unique_ptr<State>& s) { return s->id() == state_id; });
    if (it == registry_.end()) {
        MPLOG_WARN(TAG, "状態 %s は未登録", state_id.c_str());
        return false;
    }
    registry_.erase(it);
    MPLOG_INFO(TAG, "状態削除: %s", state_id.c_str());
    return true;
}

State* NavigationEngine::getState(const std::string& state_id) const {
    for (const auto& s : registry_) {
        if (s->id() == state_id) return s.get();
    }
    return nullptr;
}

std::vector<std::string> NavigationEngine::listStates() const {
    std::vector<std::string> ids;
    ids.reserve(registry_.size());
    for (const auto& s : registry_) ids.push_back(s->id());
    return ids;
}

// =============================================================================
// 実行
// =============================================================================

void NavigationEngine::stop() {
    services_.stop.request();
    MPLOG_INFO(TAG, "停止要求");
}

void NavigationEngine::publishRunState() {
    telemetry_.setRunState(current_, visited_, repeat_counter_, running_.load());
}

void NavigationEngine::nudge(const std::string& state_id) {
    MPLOG_WARN(TAG, "%s: 再訪 %d 回 → nudge (%s)", state_id.c_str(), repeat_counter_,
               config_.state_machine.fallback_key.c_str());
    (void)services_.clicker.pressFallbackKey();
    services_.clock.sleepFor(fromSeconds(config_.state_machine.nudge_pause_sec));
}

Transition NavigationEngine::executeState(const std::string& state_id,
                                          const std::optional<std::string>& previous) {
    Transition t;
    t.from_state = state_id;
    t.timestamp = std::chrono::system_clock::now();
    const auto start = services_.clock.now();

    State* state = getState(state_id);
    if (!state) {
        t.outcome = TransitionOutcome::Failed;
        t.error_detail = "unknown state: " + state_id;
        MPLOG_ERROR(TAG, "未登録の状態: %s", state_id.c_str());
        return t;
    }

    if (previous && !state->canEnterFrom(*previous)) {
        std::runtime_error refused("transition " + *previous + " -> " + state_id + " refused");
        t.outcome = TransitionOutcome::Failed;
        t.error_detail = refused.what();
        t.to_state = state->onError(refused);
        MPLOG_WARN(TAG, "%s → 回復先 %s", refused.what(),
                   t.to_state ? t.to_state->c_str() : "(none)");
        t.execution_sec = toSeconds(services_.clock.now() - start);
        return t;
    }

    StateContext ctx{services_.probe, services_.clicker, services_.injector,
                     services_.clock, config_, &services_.stop};
    try {
        state->onEnter();
        StepResult r = state->execute(ctx);
        t.to_state = r.next;
        t.outcome = r.outcome;
        t.error_detail = r.detail;
        state->onExit(r.next);
    } catch (const std::exception& e) {
        t.outcome = TransitionOutcome::Failed;
        t.error_detail = e.what();
        t.to_state = state->onError(e);
        MPLOG_ERROR(TAG, "%s 実行例外: %s → %s", state_id.c_str(), e.what(),
                    t.to_state ? t.to_state->c_str() : "(none)");
    } catch (...) {
        // std::exception 以外の送出も onError に回し、run() の外へは出さない
        std::runtime_error err("non-standard exception from " + state_id);
        t.outcome = TransitionOutcome::Failed;
        t.error_detail = err.what();
        t.to_state = state->onError(err);
        MPLOG_ERROR(TAG, "%s 実行例外 (non-std) → %s", state_id.c_str(),
                    t.to_state ? t.to_state->c_str() : "(none)");
    }

    t.execution_sec = toSeconds(services_.clock.now() - start);
    if (t.outcome == TransitionOutcome::Failed) {
        MPLOG_WARN(TAG, "%s 失敗 (%.2fs): %s", state_id.c_str(), t.execution_sec,
                   t.error_detail.c_str());
    }
    return t;
}

Result<RunReport> NavigationEngine::run(const std::optional<std::string>& initial_state,
                                        std::optional<int> max_iterations) {
    auto problems = config::validateConfig(config_);
    if (!problems.empty()) {
        ConfigError err(std::move(problems));
        MPLOG_ERROR(TAG, "実行拒否: %s", err.message.c_str());
        return Result<RunReport>(Error(err.message));
    }

    const int budget = max_iterations.value_or(config_.state_machine.max_iterations);
    if (budget < 1) {
        return Err<RunReport>("max_iterations must be >= 1");
    }

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        MPLOG_ERROR(TAG, "実行拒否: already running");
        return Err<RunReport>("already running");
    }
    // 例外で抜けても running_ を戻す
    struct RunningGuard {
        std::atomic<bool>& flag;
        ~RunningGuard() { flag.store(false); }
    } running_guard{running_};

    current_ = initial_state.value_or(config_.state_machine.initial_state);
    visited_.clear();
    repeat_counter_ = 0;
    publishRunState();

    const auto& sm = config_.state_machine;
    RunReport report;
    std::optional<std::string> previous;
    std::optional<Transition> last;

    MPLOG_INFO(TAG, "実行開始: initial=%s budget=%d", current_->c_str(), budget);

    while (true) {
        if (services_.stop.requested()) {
            report.outcome = RunOutcome::Aborted;
            report.reason = StopReason::StopRequested;
            break;
        }
        if (!current_) {
            report.outcome = RunOutcome::Completed;
            report.reason = (last && last->outcome == TransitionOutcome::Failed)
                                ? StopReason::DeadEnd : StopReason::ReachedTerminal;
            break;
        }
        if (report.iterations >= budget) {
            report.outcome = RunOutcome::Interrupted;
            report.reason = StopReason::IterationBudget;
            break;
        }

        ++report.iterations;
        const std::string id = *current_;

        if (visited_.count(id)) {
            ++repeat_counter_;
            MPLOG_WARN(TAG, "再訪: %s (repeat=%d)", id.c_str(), repeat_counter_);

            if (repeat_counter_ >= sm.break_count) {
                MPLOG_ERROR(TAG, "再訪 %d 回で中断 (break_count=%d)", repeat_counter_, sm.break_count);
                if (services_.bus) {
                    StuckLoopEvent evt;
                    evt.state_id = id;
                    evt.repeat_count = repeat_counter_;
                    evt.aborted = true;
                    services_.bus->publish(evt);
                }
                report.outcome = RunOutcome::Aborted;
                report.reason = StopReason::StuckLoop;
                break;
            }
            if (repeat_counter_ == sm.max_stop_count) {
                nudge(id);
                ++report.nudges;
                if (services_.bus) {
                    StuckLoopEvent evt;
                    evt.state_id = id;
                    evt.repeat_count = repeat_counter_;
                    evt.aborted = false;
                    services_.bus->publish(evt);
                }
            }
        } else {
            repeat_counter_ = 0;
        }

        visited_.insert(id);
        publishRunState();

        if (services_.bus) {
            StateEnteredEvent evt;
            evt.state_id = id;
            evt.iteration = report.iterations;
            services_.bus->publish(evt);
        }

        Transition t = executeState(id, previous);
        telemetry_.record(t);
        if (services_.bus) {
            TransitionEvent evt;
            evt.from_state = t.from_state;
            evt.to_state = t.to_state.value_or("");
            evt.outcome = static_cast<int>(t.outcome);
            evt.execution_sec = t.execution_sec;
            evt.error_detail = t.error_detail;
            services_.bus->publish(evt);
        }

        previous = id;
        report.last_executed = id;
        current_ = t.to_state;
        last = std::move(t);
        publishRunState();

        if (current_ && sm.state_transition_delay_sec > 0.0) {
            services_.clock.sleepFor(fromSeconds(sm.state_transition_delay_sec));
        }
    }

    report.final_state = current_;
    running_.store(false);
    publishRunState();

    auto level = report.outcome == RunOutcome::Completed ? menupilot::log::Level::Info
                                                         : menupilot::log::Level::Warn;
    menupilot::log::write(level, TAG, "実行終了: %s (%s) iterations=%d final=%s",
               runOutcomeToString(report.outcome), stopReasonToString(report.reason),
               report.iterations, report.final_state ? report.final_state->c_str() : "(none)");

    if (services_.bus) {
        RunFinishedEvent evt;
        evt.outcome = static_cast<int>(report.outcome);
        evt.iterations = report.iterations;
        evt.final_state = report.final_state.value_or("");
        services_.bus->publish(evt);
    }
    return Ok(std::move(report));
}

} // namespace menupilot::nav
