#pragma once
// Time-based phase generator. One driver per animated element.
//
// The owner feeds wall-clock time through tick() once per frame; the driver
// computes the phase for that instant and pushes it to its subscribers. The
// phase is never exposed as shared mutable state: subscribers only ever see
// the value passed to their callback.
//
// Lifecycle: start() -> subscribe() ... tick() ... -> unsubscribe()/stop().
// stop() and unsubscribe() are synchronous: once they return, the affected
// callbacks are never invoked again, even if called from inside a callback.

#include <cstdint>

enum class LoopPolicy : uint8_t {
    PING_PONG = 0, // 0 -> 1 -> 0, period = 2 * cycle
    WRAP      = 1, // 0 -> 1, jump to 0 (sawtooth), period = cycle
};

struct AnimDriverConfig {
    uint32_t   cycle_ms = 2000;
    LoopPolicy policy   = LoopPolicy::PING_PONG;
};

using PhaseCallback  = void (*)(float phase, void* user);
using SubscriptionId = uint16_t;

constexpr SubscriptionId INVALID_SUBSCRIPTION = 0;

class AnimDriver {
public:
    static constexpr uint8_t MAX_SUBSCRIBERS = 8;

    enum class State : uint8_t {
        IDLE    = 0, // never started; subscriptions accepted
        RUNNING = 1,
        STOPPED = 2, // subscriptions rejected until the next start()
    };

    AnimDriver() = default;
    ~AnimDriver();

    AnimDriver(const AnimDriver&)            = delete;
    AnimDriver& operator=(const AnimDriver&) = delete;

    // Phase starts at 0 at now_us. Fails on cycle_ms == 0 or if already running.
    bool start(const AnimDriverConfig& cfg, int64_t now_us);

    // Halts ticks and releases every subscription. Idempotent.
    void stop();

    // Returns INVALID_SUBSCRIPTION when the driver is stopped, the table is
    // full, or cb is null. Callbacks added from inside a tick are first
    // invoked on the next tick.
    SubscriptionId subscribe(PhaseCallback cb, void* user);

    // False if id is not (or no longer) registered.
    bool unsubscribe(SubscriptionId id);

    // Advance to now_us and notify subscribers. Timestamps older than the
    // previous tick are ignored.
    void tick(int64_t now_us);

    State   state() const { return state_; }
    bool    running() const { return state_ == State::RUNNING; }
    float   phase() const { return phase_; }
    uint8_t subscriber_count() const;

    const AnimDriverConfig& config() const { return cfg_; }

    // Phase for a given elapsed time since start.
    // PING_PONG: 0 at t=0, 1 at t=cycle, 0 at t=2*cycle.
    // WRAP: in [0,1); t=cycle wraps to 0.
    static float phase_at(const AnimDriverConfig& cfg, int64_t elapsed_us);

private:
    struct Slot {
        SubscriptionId id   = INVALID_SUBSCRIPTION;
        PhaseCallback  cb   = nullptr;
        void*          user = nullptr;
        bool           armed = false; // false until the tick that added it is over
    };

    SubscriptionId next_id();

    AnimDriverConfig cfg_{};
    State            state_ = State::IDLE;
    int64_t          start_us_ = 0;
    int64_t          last_tick_us_ = 0;
    float            phase_ = 0.0f;
    bool             in_tick_ = false;
    SubscriptionId   id_seq_ = 0;
    Slot             slots_[MAX_SUBSCRIBERS]{};
};

// Scoped subscription: released when destroyed or reset().
class AnimSubscription {
public:
    AnimSubscription() = default;
    AnimSubscription(AnimDriver& driver, PhaseCallback cb, void* user);
    ~AnimSubscription() { reset(); }

    AnimSubscription(const AnimSubscription&)            = delete;
    AnimSubscription& operator=(const AnimSubscription&) = delete;
    AnimSubscription(AnimSubscription&& other) noexcept;
    AnimSubscription& operator=(AnimSubscription&& other) noexcept;

    bool           valid() const { return driver_ != nullptr && id_ != INVALID_SUBSCRIPTION; }
    SubscriptionId id() const { return id_; }
    void           reset();

private:
    AnimDriver*    driver_ = nullptr;
    SubscriptionId id_     = INVALID_SUBSCRIPTION;
};
