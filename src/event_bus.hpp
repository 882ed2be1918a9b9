// =============================================================================
// MenuPilot - Event Bus
// =============================================================================
// 型ごとの publish/subscribe。NavigationEngine と ClickOrchestrator が発行し、
// CLI のログ出力やテストが購読する。エンジンは EventBus* を借りるだけ（nullable）。
//   auto sub = bus.subscribe<TransitionEvent>([](const TransitionEvent& e) { ... });
//   bus.publish(evt);
// =============================================================================
#pragma once
#include <algorithm>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>
#include "menupilot_log.hpp"

namespace menupilot {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

// 状態進入（NavigationEngine → ログ/GUI）
struct StateEnteredEvent : Event {
    std::string state_id;
    int iteration = 0;
};

// 状態遷移記録（Transition 1件ごとに発行）
struct TransitionEvent : Event {
    std::string from_state;
    std::string to_state;       // 空 = 後続なし
    int outcome = 0;            // TransitionOutcome enum値
    double execution_sec = 0.0;
    std::string error_detail;
};

// スタックループ検出（nudge / abort）
struct StuckLoopEvent : Event {
    std::string state_id;
    int repeat_count = 0;
    bool aborted = false;       // false = nudge
};

// 実行終了
struct RunFinishedEvent : Event {
    int outcome = 0;            // RunOutcome enum値
    int iterations = 0;
    std::string final_state;
};

// 入力注入（ClickOrchestrator → ログ/GUI）
struct TapCommandEvent : Event {
    std::string template_id;
    int x = 0, y = 0;
    bool ok = false;
};

struct KeyCommandEvent : Event {
    std::string key;
    bool ok = false;
};

// =============================================================================
// EventBus
// =============================================================================
// ハンドラ表は shared_ptr で保持し、SubscriptionHandle は weak_ptr で参照する。
// バスより長生きしたハンドルの破棄は何もしない。
// publish はハンドラ一覧をコピーしてからロック外で呼ぶ（ハンドラ内の購読/解除可）。

namespace detail {

struct HandlerTable {
    struct Slot {
        uint64_t id;
        std::function<void(const Event&)> fn;
    };

    std::mutex mutex;
    std::unordered_map<std::type_index, std::vector<Slot>> slots;
    uint64_t next_id = 1;

    void remove(std::type_index key, uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = slots.find(key);
        if (it == slots.end()) return;
        auto& vec = it->second;
        vec.erase(std::remove_if(vec.begin(), vec.end(),
                                 [id](const Slot& s) { return s.id == id; }),
                  vec.end());
    }
};

} // namespace detail

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    SubscriptionHandle(std::weak_ptr<detail::HandlerTable> table, std::type_index key, uint64_t id)
        : table_(std::move(table)), key_(key), id_(id) {}
    ~SubscriptionHandle() { reset(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept
        : table_(std::move(o.table_)), key_(o.key_), id_(o.id_) { o.id_ = 0; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (this != &o) {
            reset();
            table_ = std::move(o.table_);
            key_ = o.key_;
            id_ = o.id_;
            o.id_ = 0;
        }
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    // 購読を解除せずにハンドルだけ手放す（バスの寿命まで有効）
    void release() { id_ = 0; table_.reset(); }

    void reset() {
        if (id_ == 0) return;
        if (auto t = table_.lock()) t->remove(key_, id_);
        id_ = 0;
        table_.reset();
    }

private:
    std::weak_ptr<detail::HandlerTable> table_;
    std::type_index key_ = std::type_index(typeid(void));
    uint64_t id_ = 0;
};

class EventBus {
public:
    EventBus() : table_(std::make_shared<detail::HandlerTable>()) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");
        const auto key = std::type_index(typeid(T));

        std::lock_guard<std::mutex> lock(table_->mutex);
        const uint64_t id = table_->next_id++;
        table_->slots[key].push_back({id, [h = std::move(handler)](const Event& e) {
            h(static_cast<const T&>(e));
        }});
        return SubscriptionHandle(table_, key, id);
    }

    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::vector<detail::HandlerTable::Slot> targets;
        {
            std::lock_guard<std::mutex> lock(table_->mutex);
            auto it = table_->slots.find(std::type_index(typeid(T)));
            if (it == table_->slots.end()) return;
            targets = it->second;
        }

        for (const auto& slot : targets) {
            try {
                slot.fn(event);
            } catch (const std::exception& e) {
                // 報告側の失敗でナビゲーションを止めない
                MPLOG_ERROR("eventbus", "handler %llu (%s) threw: %s",
                            (unsigned long long)slot.id, typeid(T).name(), e.what());
            }
        }
    }

    template<typename T>
    bool has_subscribers() const {
        std::lock_guard<std::mutex> lock(table_->mutex);
        auto it = table_->slots.find(std::type_index(typeid(T)));
        return it != table_->slots.end() && !it->second.empty();
    }

private:
    std::shared_ptr<detail::HandlerTable> table_;
};

} // namespace menupilot
