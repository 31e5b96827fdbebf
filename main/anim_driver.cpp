#include "anim_driver.h"

#include <utility>

AnimDriver::~AnimDriver()
{
    stop();
}

bool AnimDriver::start(const AnimDriverConfig& cfg, int64_t now_us)
{
    if (cfg.cycle_ms == 0 || state_ == State::RUNNING) return false;

    cfg_ = cfg;
    start_us_ = now_us;
    last_tick_us_ = now_us;
    phase_ = 0.0f;
    state_ = State::RUNNING;
    return true;
}

void AnimDriver::stop()
{
    if (state_ == State::STOPPED) return;
    state_ = State::STOPPED;
    for (auto& s : slots_) {
        s = Slot{};
    }
}

SubscriptionId AnimDriver::next_id()
{
    // Ids are never reused while a slot may still hold them; skip 0 and live ids.
    for (;;) {
        id_seq_++;
        if (id_seq_ == INVALID_SUBSCRIPTION) continue;
        bool taken = false;
        for (const auto& s : slots_) {
            if (s.id == id_seq_) {
                taken = true;
                break;
            }
        }
        if (!taken) return id_seq_;
    }
}

SubscriptionId AnimDriver::subscribe(PhaseCallback cb, void* user)
{
    if (!cb || state_ == State::STOPPED) return INVALID_SUBSCRIPTION;

    for (auto& s : slots_) {
        if (s.id != INVALID_SUBSCRIPTION) continue;
        s.id = next_id();
        s.cb = cb;
        s.user = user;
        s.armed = !in_tick_;
        return s.id;
    }
    return INVALID_SUBSCRIPTION; // full
}

bool AnimDriver::unsubscribe(SubscriptionId id)
{
    if (id == INVALID_SUBSCRIPTION) return false;
    for (auto& s : slots_) {
        if (s.id == id) {
            s = Slot{};
            return true;
        }
    }
    return false;
}

uint8_t AnimDriver::subscriber_count() const
{
    uint8_t n = 0;
    for (const auto& s : slots_) {
        if (s.id != INVALID_SUBSCRIPTION) n++;
    }
    return n;
}

float AnimDriver::phase_at(const AnimDriverConfig& cfg, int64_t elapsed_us)
{
    if (cfg.cycle_ms == 0 || elapsed_us <= 0) return 0.0f;

    const int64_t cycle_us = static_cast<int64_t>(cfg.cycle_ms) * 1000;
    if (cfg.policy == LoopPolicy::WRAP) {
        const int64_t t = elapsed_us % cycle_us;
        return static_cast<float>(static_cast<double>(t) / static_cast<double>(cycle_us));
    }

    const int64_t t = elapsed_us % (2 * cycle_us);
    if (t <= cycle_us) {
        return static_cast<float>(static_cast<double>(t) / static_cast<double>(cycle_us));
    }
    return static_cast<float>(static_cast<double>(2 * cycle_us - t) / static_cast<double>(cycle_us));
}

void AnimDriver::tick(int64_t now_us)
{
    if (state_ != State::RUNNING || now_us < last_tick_us_) return;

    last_tick_us_ = now_us;
    phase_ = phase_at(cfg_, now_us - start_us_);
    const float phase = phase_;

    in_tick_ = true;
    for (auto& s : slots_) {
        // A callback may stop the driver or drop other subscriptions.
        if (state_ != State::RUNNING) break;
        if (s.id == INVALID_SUBSCRIPTION || !s.armed) continue;
        s.cb(phase, s.user);
    }
    in_tick_ = false;

    for (auto& s : slots_) {
        if (s.id != INVALID_SUBSCRIPTION) s.armed = true;
    }
}

// ---- AnimSubscription ----

AnimSubscription::AnimSubscription(AnimDriver& driver, PhaseCallback cb, void* user)
    : driver_(&driver), id_(driver.subscribe(cb, user))
{
    if (id_ == INVALID_SUBSCRIPTION) driver_ = nullptr;
}

AnimSubscription::AnimSubscription(AnimSubscription&& other) noexcept
    : driver_(std::exchange(other.driver_, nullptr)), id_(std::exchange(other.id_, INVALID_SUBSCRIPTION))
{
}

AnimSubscription& AnimSubscription::operator=(AnimSubscription&& other) noexcept
{
    if (this != &other) {
        reset();
        driver_ = std::exchange(other.driver_, nullptr);
        id_ = std::exchange(other.id_, INVALID_SUBSCRIPTION);
    }
    return *this;
}

void AnimSubscription::reset()
{
    if (driver_ && id_ != INVALID_SUBSCRIPTION) {
        driver_->unsubscribe(id_);
    }
    driver_ = nullptr;
    id_ = INVALID_SUBSCRIPTION;
}
