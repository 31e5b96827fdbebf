#include <gtest/gtest.h>

#include "anim_driver.h"

#include <vector>

static constexpr int64_t MS = 1000;

namespace {

struct Recorder {
    std::vector<float> phases;
};

void record_cb(float phase, void* user)
{
    static_cast<Recorder*>(user)->phases.push_back(phase);
}

AnimDriverConfig ping_pong(uint32_t cycle_ms)
{
    return AnimDriverConfig{.cycle_ms = cycle_ms, .policy = LoopPolicy::PING_PONG};
}

AnimDriverConfig wrap(uint32_t cycle_ms)
{
    return AnimDriverConfig{.cycle_ms = cycle_ms, .policy = LoopPolicy::WRAP};
}

} // namespace

// ---- Phase function ---------------------------------------------------------

TEST(AnimPhase, PingPongRisesThenFalls)
{
    const AnimDriverConfig cfg = ping_pong(2000);
    EXPECT_FLOAT_EQ(AnimDriver::phase_at(cfg, 0), 0.0f);
    EXPECT_FLOAT_EQ(AnimDriver::phase_at(cfg, 1000 * MS), 0.5f);
    EXPECT_FLOAT_EQ(AnimDriver::phase_at(cfg, 2000 * MS), 1.0f);
    EXPECT_FLOAT_EQ(AnimDriver::phase_at(cfg, 3000 * MS), 0.5f);
    EXPECT_FLOAT_EQ(AnimDriver::phase_at(cfg, 4000 * MS), 0.0f);
    EXPECT_FLOAT_EQ(AnimDriver::phase_at(cfg, 6000 * MS), 1.0f);
}

TEST(AnimPhase, WrapIsSawtoothWithExclusiveTop)
{
    const AnimDriverConfig cfg = wrap(5000);
    EXPECT_FLOAT_EQ(AnimDriver::phase_at(cfg, 0), 0.0f);
    EXPECT_FLOAT_EQ(AnimDriver::phase_at(cfg, 2500 * MS), 0.5f);
    EXPECT_NEAR(AnimDriver::phase_at(cfg, 4999 * MS), 0.9998f, 1e-4f);
    EXPECT_FLOAT_EQ(AnimDriver::phase_at(cfg, 5000 * MS), 0.0f);
    EXPECT_FLOAT_EQ(AnimDriver::phase_at(cfg, 7500 * MS), 0.5f);
}

TEST(AnimPhase, StaysInUnitRange)
{
    for (int64_t t = 0; t < 20000 * MS; t += 37 * MS) {
        for (const AnimDriverConfig& cfg : {ping_pong(700), wrap(700)}) {
            const float p = AnimDriver::phase_at(cfg, t);
            EXPECT_GE(p, 0.0f);
            EXPECT_LE(p, 1.0f);
        }
    }
}

// ---- Lifecycle --------------------------------------------------------------

TEST(AnimDriver, RejectsZeroCycleAndDoubleStart)
{
    AnimDriver d;
    EXPECT_FALSE(d.start(wrap(0), 0));
    EXPECT_EQ(d.state(), AnimDriver::State::IDLE);
    EXPECT_TRUE(d.start(wrap(1000), 0));
    EXPECT_FALSE(d.start(wrap(1000), 0));
}

TEST(AnimDriver, TickDeliversPhaseToSubscribers)
{
    AnimDriver d;
    Recorder   a, b;
    ASSERT_TRUE(d.start(ping_pong(2000), 100 * MS));
    ASSERT_NE(d.subscribe(record_cb, &a), INVALID_SUBSCRIPTION);
    ASSERT_NE(d.subscribe(record_cb, &b), INVALID_SUBSCRIPTION);

    d.tick(1100 * MS);
    ASSERT_EQ(a.phases.size(), 1u);
    ASSERT_EQ(b.phases.size(), 1u);
    EXPECT_FLOAT_EQ(a.phases[0], 0.5f);
    EXPECT_FLOAT_EQ(b.phases[0], 0.5f);
    EXPECT_FLOAT_EQ(d.phase(), 0.5f);
}

TEST(AnimDriver, SubscribeBeforeStartIsAcceptedButSilent)
{
    AnimDriver d;
    Recorder   r;
    ASSERT_NE(d.subscribe(record_cb, &r), INVALID_SUBSCRIPTION);
    d.tick(500 * MS);
    EXPECT_TRUE(r.phases.empty());

    ASSERT_TRUE(d.start(wrap(1000), 500 * MS));
    d.tick(750 * MS);
    ASSERT_EQ(r.phases.size(), 1u);
    EXPECT_FLOAT_EQ(r.phases[0], 0.25f);
}

TEST(AnimDriver, UnsubscribeStopsCallbacks)
{
    AnimDriver d;
    Recorder   r;
    ASSERT_TRUE(d.start(wrap(1000), 0));
    const SubscriptionId id = d.subscribe(record_cb, &r);
    ASSERT_NE(id, INVALID_SUBSCRIPTION);
    EXPECT_EQ(d.subscriber_count(), 1);

    d.tick(100 * MS);
    EXPECT_TRUE(d.unsubscribe(id));
    EXPECT_FALSE(d.unsubscribe(id));
    EXPECT_EQ(d.subscriber_count(), 0);
    d.tick(200 * MS);
    EXPECT_EQ(r.phases.size(), 1u);
}

TEST(AnimDriver, StopReleasesEverythingAndRejectsSubscribers)
{
    AnimDriver d;
    Recorder   r;
    ASSERT_TRUE(d.start(wrap(1000), 0));
    ASSERT_NE(d.subscribe(record_cb, &r), INVALID_SUBSCRIPTION);

    d.stop();
    EXPECT_EQ(d.state(), AnimDriver::State::STOPPED);
    EXPECT_EQ(d.subscriber_count(), 0);
    EXPECT_EQ(d.subscribe(record_cb, &r), INVALID_SUBSCRIPTION);
    d.tick(500 * MS);
    EXPECT_TRUE(r.phases.empty());

    d.stop();
    EXPECT_TRUE(d.start(wrap(1000), 1000 * MS));
    EXPECT_NE(d.subscribe(record_cb, &r), INVALID_SUBSCRIPTION);
}

TEST(AnimDriver, OlderTimestampIsIgnored)
{
    AnimDriver d;
    Recorder   r;
    ASSERT_TRUE(d.start(wrap(1000), 0));
    ASSERT_NE(d.subscribe(record_cb, &r), INVALID_SUBSCRIPTION);

    d.tick(400 * MS);
    d.tick(300 * MS);
    ASSERT_EQ(r.phases.size(), 1u);
    EXPECT_FLOAT_EQ(d.phase(), 0.4f);
}

TEST(AnimDriver, TableHoldsMaxSubscribers)
{
    AnimDriver d;
    Recorder   r;
    for (int i = 0; i < AnimDriver::MAX_SUBSCRIBERS; i++) {
        EXPECT_NE(d.subscribe(record_cb, &r), INVALID_SUBSCRIPTION);
    }
    EXPECT_EQ(d.subscribe(record_cb, &r), INVALID_SUBSCRIPTION);
    EXPECT_EQ(d.subscribe(nullptr, &r), INVALID_SUBSCRIPTION);
}

// ---- Re-entrancy ------------------------------------------------------------

namespace {

struct SelfRemover {
    AnimDriver*    driver = nullptr;
    SubscriptionId id = INVALID_SUBSCRIPTION;
    int            calls = 0;
};

void remove_self_cb(float, void* user)
{
    auto* s = static_cast<SelfRemover*>(user);
    s->calls++;
    s->driver->unsubscribe(s->id);
}

struct Adder {
    AnimDriver* driver = nullptr;
    Recorder*   late = nullptr;
    bool        added = false;
};

void add_other_cb(float, void* user)
{
    auto* a = static_cast<Adder*>(user);
    if (!a->added) {
        a->added = a->driver->subscribe(record_cb, a->late) != INVALID_SUBSCRIPTION;
    }
}

void stop_cb(float, void* user)
{
    static_cast<AnimDriver*>(user)->stop();
}

} // namespace

TEST(AnimDriver, CallbackMayUnsubscribeItself)
{
    AnimDriver  d;
    SelfRemover s;
    s.driver = &d;
    ASSERT_TRUE(d.start(wrap(1000), 0));
    s.id = d.subscribe(remove_self_cb, &s);

    d.tick(100 * MS);
    d.tick(200 * MS);
    EXPECT_EQ(s.calls, 1);
    EXPECT_EQ(d.subscriber_count(), 0);
}

TEST(AnimDriver, SubscriberAddedDuringTickStartsNextTick)
{
    AnimDriver d;
    Recorder   late;
    Adder      adder{&d, &late, false};
    ASSERT_TRUE(d.start(wrap(1000), 0));
    ASSERT_NE(d.subscribe(add_other_cb, &adder), INVALID_SUBSCRIPTION);

    d.tick(100 * MS);
    EXPECT_TRUE(adder.added);
    EXPECT_TRUE(late.phases.empty());

    d.tick(200 * MS);
    ASSERT_EQ(late.phases.size(), 1u);
    EXPECT_FLOAT_EQ(late.phases[0], 0.2f);
}

TEST(AnimDriver, StopFromCallbackSkipsRemainingSubscribers)
{
    AnimDriver d;
    Recorder   r;
    ASSERT_TRUE(d.start(wrap(1000), 0));
    ASSERT_NE(d.subscribe(stop_cb, &d), INVALID_SUBSCRIPTION);
    ASSERT_NE(d.subscribe(record_cb, &r), INVALID_SUBSCRIPTION);

    d.tick(100 * MS);
    EXPECT_TRUE(r.phases.empty());
    EXPECT_EQ(d.state(), AnimDriver::State::STOPPED);
}

// ---- Scoped subscription ----------------------------------------------------

TEST(AnimSubscription, ReleasesOnScopeExit)
{
    AnimDriver d;
    Recorder   r;
    ASSERT_TRUE(d.start(wrap(1000), 0));
    {
        AnimSubscription sub(d, record_cb, &r);
        EXPECT_TRUE(sub.valid());
        EXPECT_EQ(d.subscriber_count(), 1);
    }
    EXPECT_EQ(d.subscriber_count(), 0);
    d.tick(100 * MS);
    EXPECT_TRUE(r.phases.empty());
}

TEST(AnimSubscription, MoveTransfersOwnership)
{
    AnimDriver d;
    Recorder   r;
    ASSERT_TRUE(d.start(wrap(1000), 0));

    AnimSubscription a(d, record_cb, &r);
    AnimSubscription b(std::move(a));
    EXPECT_FALSE(a.valid());
    EXPECT_TRUE(b.valid());
    EXPECT_EQ(d.subscriber_count(), 1);

    b.reset();
    EXPECT_EQ(d.subscriber_count(), 0);
}

TEST(AnimSubscription, InvalidWhenDriverStopped)
{
    AnimDriver d;
    Recorder   r;
    d.stop();
    AnimSubscription sub(d, record_cb, &r);
    EXPECT_FALSE(sub.valid());
}
