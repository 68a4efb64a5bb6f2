#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

#include "adaptive_sampler.hpp"
#include "sampling_timer.hpp"
#include "test_fakes.hpp"

using namespace journal;
using namespace journal::test;

namespace {
    struct SamplerHarness {
        explicit SamplerHarness(const TrackingTuning &t = TrackingTuning{}) : tuning(t) {
        }

        TrackingTuning tuning;
        FakeLocation location;
        RecordingSink sink;
        RecordingSleeper sleeper;
        BatchRetryScheduler retry{RetryTuning{}, sleeper};
        LocationIngestPipeline pipeline{tuning, sink, retry};
        ManualTimer timer;
        RecordingListener listener;
        AdaptiveSampler sampler{tuning, location, pipeline, timer, &listener};
    };

    std::vector<DwellEventKind> kinds(const std::vector<DwellEvent> &events) {
        std::vector<DwellEventKind> result;
        for (const auto &e: events) {
            result.push_back(e.kind);
        }
        return result;
    }

    /// Stops the sampler from inside the dwell callback.
    class StopOnDwellListener final : public StepAssignmentListener {
    public:
        void onClusterFinalized(const PhotoCluster &) override {
        }

        void onDwellEvent(const DwellEvent &) override {
            if (sampler && !done) {
                stop_result = sampler->stop();
                done = true;
            }
        }

        AdaptiveSampler *sampler = nullptr;
        OpResult stop_result;
        std::atomic<bool> done{false};
    };

    /// ManualTimer whose cancel() first runs a one-shot hook.
    class HookTimer final : public SamplingTimer {
    public:
        void schedule(const std::chrono::milliseconds delay, std::function<void()> task) override {
            inner.schedule(delay, std::move(task));
        }

        void cancel() override {
            if (on_cancel) {
                auto hook = std::move(on_cancel);
                on_cancel = nullptr;
                hook();
            }
            inner.cancel();
        }

        ManualTimer inner;
        std::function<void()> on_cancel;
    };

    bool waitUntil(const std::function<bool()> &condition,
                   const std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!condition()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }

    TrackingTuning fastTuning() {
        TrackingTuning tuning;
        tuning.active_interval_ms = 2;
        tuning.stationary_interval_ms = 2;
        tuning.idle_interval_ms = 2;
        return tuning;
    }

    std::vector<std::int64_t> timestamps(const std::vector<LocationFix> &fixes) {
        std::vector<std::int64_t> result;
        for (const auto &f: fixes) {
            result.push_back(f.timestamp_ms);
        }
        return result;
    }
}

TEST(AdaptiveSampler, StartWithoutPermissionStaysStopped) {
    SamplerHarness h;
    h.location.permission = false;

    EXPECT_EQ(h.sampler.start("trip").status, JournalStatus::PERMISSION_DENIED);
    EXPECT_EQ(h.sampler.lifecycle(), Lifecycle::STOPPED);
    EXPECT_FALSE(h.timer.hasPending());
}

TEST(AdaptiveSampler, ResumeWithoutSessionFails) {
    SamplerHarness h;
    EXPECT_EQ(h.sampler.resume().status, JournalStatus::NO_ACTIVE_SESSION);
    EXPECT_EQ(h.sampler.pause().status, JournalStatus::NO_ACTIVE_SESSION);
    EXPECT_EQ(h.sampler.stop().status, JournalStatus::NO_ACTIVE_SESSION);
}

TEST(AdaptiveSampler, StartSchedulesImmediateCapture) {
    SamplerHarness h;
    ASSERT_TRUE(h.sampler.start("trip").ok());
    EXPECT_EQ(h.sampler.lifecycle(), Lifecycle::ACTIVE);
    EXPECT_TRUE(h.timer.hasPending());
    EXPECT_EQ(h.timer.pendingDelay().count(), 0);
    EXPECT_EQ(h.sampler.start("other").status, JournalStatus::INVALID_TRANSITION);
}

TEST(AdaptiveSampler, TimerFiresTicks) {
    SamplerHarness h;
    h.location.fixes = {rawFix(48.0, 11.0, 0), rawFix(48.0, 11.0, 600000)};
    ASSERT_TRUE(h.sampler.start("trip").ok());

    EXPECT_TRUE(h.timer.fire());
    EXPECT_TRUE(h.timer.fire());

    EXPECT_EQ(h.sampler.session().last_fix->timestamp_ms, 600000);
    EXPECT_EQ(h.timer.scheduledCount(), 3);
}

TEST(AdaptiveSampler, IntervalFollowsMotion) {
    SamplerHarness h;
    h.location.fixes = {rawFix(48.0, 11.0, 0), rawFix(48.003, 11.0, 30000)};
    ASSERT_TRUE(h.sampler.start("trip").ok());

    h.sampler.tick();
    EXPECT_EQ(h.timer.pendingDelay().count(), 600000);

    const TickResult moving = h.sampler.tick();
    ASSERT_TRUE(moving.result.ok());
    EXPECT_EQ(moving.fix->activity, MotionState::DRIVING);
    EXPECT_EQ(h.timer.pendingDelay().count(), 30000);
    EXPECT_EQ(h.sampler.currentRequest().desired_accuracy_m, h.tuning.high_accuracy_m);
}

TEST(AdaptiveSampler, BatterySaverForcesStationaryCadence) {
    SamplerHarness h;
    h.location.fixes = {
        rawFix(48.0, 11.0, 0, 0.9),
        rawFix(48.003, 11.0, 30000, 0.15),
        rawFix(48.006, 11.0, 60000),
        rawFix(48.009, 11.0, 90000, 0.5)
    };
    ASSERT_TRUE(h.sampler.start("trip").ok());
    h.sampler.tick();

    h.sampler.tick();
    EXPECT_TRUE(h.sampler.session().battery_saver);
    EXPECT_EQ(h.sampler.nextIntervalMs(), 600000);
    EXPECT_EQ(h.sampler.currentRequest().desired_accuracy_m, h.tuning.low_accuracy_m);

    // no battery reading keeps the mode
    h.sampler.tick();
    EXPECT_TRUE(h.sampler.session().battery_saver);

    h.sampler.tick();
    EXPECT_FALSE(h.sampler.session().battery_saver);
    EXPECT_EQ(h.timer.pendingDelay().count(), 30000);
}

TEST(AdaptiveSampler, MissingFixRetriesAtIdleInterval) {
    SamplerHarness h;
    ASSERT_TRUE(h.sampler.start("trip").ok());

    EXPECT_EQ(h.sampler.tick().result.status, JournalStatus::NO_FIX);
    EXPECT_EQ(h.timer.pendingDelay().count(), h.tuning.idle_interval_ms);
}

TEST(AdaptiveSampler, RevokedPermissionRetriesAtIdleInterval) {
    SamplerHarness h;
    ASSERT_TRUE(h.sampler.start("trip").ok());
    h.location.permission = false;

    EXPECT_EQ(h.sampler.tick().result.status, JournalStatus::PERMISSION_DENIED);
    EXPECT_EQ(h.sampler.lifecycle(), Lifecycle::ACTIVE);
    EXPECT_EQ(h.timer.pendingDelay().count(), h.tuning.idle_interval_ms);
}

TEST(AdaptiveSampler, InvalidFixIsReportedAndSamplingContinues) {
    SamplerHarness h;
    h.location.fixes = {rawFix(0.0, 200.0, 0)};
    ASSERT_TRUE(h.sampler.start("trip").ok());

    EXPECT_EQ(h.sampler.tick().result.status, JournalStatus::INVALID_COORDINATE);
    EXPECT_FALSE(h.sampler.session().last_fix.has_value());
    EXPECT_TRUE(h.timer.hasPending());
}

TEST(AdaptiveSampler, PauseCancelsAndResumeRestarts) {
    SamplerHarness h;
    h.location.fixes = {rawFix(48.0, 11.0, 0)};
    ASSERT_TRUE(h.sampler.start("trip").ok());
    h.sampler.tick();

    ASSERT_TRUE(h.sampler.pause().ok());
    EXPECT_FALSE(h.timer.hasPending());
    EXPECT_EQ(h.sampler.tick().result.status, JournalStatus::INVALID_TRANSITION);
    EXPECT_EQ(h.sampler.pause().status, JournalStatus::INVALID_TRANSITION);
    // paused sessions keep their last fix
    EXPECT_TRUE(h.sampler.session().last_fix.has_value());

    ASSERT_TRUE(h.sampler.resume().ok());
    EXPECT_EQ(h.sampler.lifecycle(), Lifecycle::ACTIVE);
    EXPECT_EQ(h.timer.pendingDelay().count(), 0);
}

TEST(AdaptiveSampler, DwellCandidateThenConfirmedThenEnded) {
    SamplerHarness h;
    h.location.fixes = {
        rawFix(48.0, 11.0, 0),
        rawFix(48.0, 11.0, 4 * MINUTE_MS),
        rawFix(48.0, 11.0, 10 * MINUTE_MS),
        rawFix(48.0001, 11.0, 30 * MINUTE_MS),
        rawFix(48.01, 11.0, 31 * MINUTE_MS)
    };
    ASSERT_TRUE(h.sampler.start("trip").ok());

    EXPECT_TRUE(h.sampler.tick().events.empty());
    EXPECT_TRUE(h.sampler.tick().events.empty());

    const TickResult candidate = h.sampler.tick();
    EXPECT_EQ(kinds(candidate.events), (std::vector{DwellEventKind::VISIT_CANDIDATE}));
    EXPECT_EQ(h.sampler.session().dwell_state, DwellState::CANDIDATE);

    const TickResult confirmed = h.sampler.tick();
    ASSERT_EQ(kinds(confirmed.events), (std::vector{DwellEventKind::DWELL_CONFIRMED}));
    EXPECT_EQ(confirmed.events[0].durationMs(), 30 * MINUTE_MS);
    EXPECT_EQ(confirmed.events[0].trip_id, "trip");

    const TickResult left = h.sampler.tick();
    EXPECT_EQ(kinds(left.events), (std::vector{DwellEventKind::DWELL_ENDED}));
    EXPECT_EQ(h.sampler.session().dwell_state, DwellState::NONE);

    EXPECT_EQ(kinds(h.listener.events), (std::vector{
                  DwellEventKind::VISIT_CANDIDATE,
                  DwellEventKind::DWELL_CONFIRMED,
                  DwellEventKind::DWELL_ENDED
              }));
}

TEST(AdaptiveSampler, DriftOutsideRadiusRestartsDwell) {
    SamplerHarness h;
    // slow creep, ~67 m per 4 minutes: stationary speed, but outside the 50 m radius
    h.location.fixes = {
        rawFix(48.0, 11.0, 0),
        rawFix(48.0006, 11.0, 4 * MINUTE_MS),
        rawFix(48.0012, 11.0, 8 * MINUTE_MS)
    };
    ASSERT_TRUE(h.sampler.start("trip").ok());
    h.sampler.tick();
    h.sampler.tick();
    const TickResult third = h.sampler.tick();

    EXPECT_TRUE(third.events.empty());
    EXPECT_EQ(h.sampler.session().dwell_started_at.value(), 8 * MINUTE_MS);
}

TEST(AdaptiveSampler, PeriodicSyncAtBatchSize) {
    TrackingTuning tuning;
    tuning.sync_batch_size = 2;
    SamplerHarness h(tuning);
    h.location.fixes = {rawFix(48.0, 11.0, 0), rawFix(48.0, 11.0, 1000), rawFix(48.0, 11.0, 2000)};
    ASSERT_TRUE(h.sampler.start("trip").ok());

    h.sampler.tick();
    EXPECT_TRUE(h.sink.fixes.empty());
    h.sampler.tick();
    EXPECT_EQ(h.sink.fixes.size(), 2u);
    EXPECT_EQ(h.pipeline.pendingCount(), 0u);
}

TEST(AdaptiveSampler, StopFlushesAndClearsSession) {
    SamplerHarness h;
    h.location.fixes = {rawFix(48.0, 11.0, 0), rawFix(48.0, 11.0, 1000)};
    ASSERT_TRUE(h.sampler.start("trip").ok());
    h.sampler.tick();
    h.sampler.tick();

    EXPECT_TRUE(h.sampler.stop().ok());
    EXPECT_EQ(h.sink.fixes.size(), 2u);
    EXPECT_EQ(h.sampler.lifecycle(), Lifecycle::STOPPED);
    EXPECT_FALSE(h.sampler.session().hasSession());
    EXPECT_FALSE(h.sampler.session().last_fix.has_value());
    EXPECT_FALSE(h.timer.hasPending());
    EXPECT_EQ(h.sampler.stop().status, JournalStatus::NO_ACTIVE_SESSION);
}

TEST(AdaptiveSampler, StopReportsFlushIncompleteWhenSinkIsDown) {
    TrackingTuning tuning;
    tuning.flush_timeout_ms = 2500;
    SamplerHarness h(tuning);
    h.location.fixes = {rawFix(48.0, 11.0, 0)};
    ASSERT_TRUE(h.sampler.start("trip").ok());
    h.sampler.tick();
    h.sink.always_fail = true;

    const OpResult result = h.sampler.stop();

    EXPECT_EQ(result.status, JournalStatus::FLUSH_INCOMPLETE);
    EXPECT_EQ(h.sampler.lifecycle(), Lifecycle::STOPPED);
    EXPECT_EQ(h.pipeline.pendingCount(), 1u);
    EXPECT_EQ(h.sleeper.delays, (std::vector<long long>{1000}));
}

TEST(AdaptiveSampler, StopFromListenerDoesNotDeadlock) {
    TrackingTuning tuning;
    tuning.short_stop_ms = 0;
    FakeLocation location;
    RecordingSink sink;
    RecordingSleeper sleeper;
    BatchRetryScheduler retry(RetryTuning{}, sleeper);
    LocationIngestPipeline pipeline(tuning, sink, retry);
    ManualTimer timer;
    StopOnDwellListener listener;
    AdaptiveSampler sampler(tuning, location, pipeline, timer, &listener);
    listener.sampler = &sampler;

    location.fixes = {rawFix(48.0, 11.0, 0)};
    ASSERT_TRUE(sampler.start("trip").ok());
    ASSERT_TRUE(timer.fire());

    EXPECT_TRUE(listener.stop_result.ok());
    EXPECT_EQ(sampler.lifecycle(), Lifecycle::STOPPED);
    EXPECT_FALSE(timer.hasPending());
    EXPECT_EQ(sink.fixes.size(), 1u);
}

TEST(AdaptiveSampler, RefusedFixIsOfferedAgainBeforeNewCapture) {
    TrackingTuning tuning;
    tuning.pending_capacity = 2;
    SamplerHarness h(tuning);
    h.location.fixes = {
        rawFix(48.0, 11.0, 0), rawFix(48.0, 11.0, 1000),
        rawFix(48.0, 11.0, 2000), rawFix(48.0, 11.0, 3000)
    };
    h.sink.always_fail = true;
    ASSERT_TRUE(h.sampler.start("trip").ok());

    EXPECT_TRUE(h.sampler.tick().result.ok());
    EXPECT_TRUE(h.sampler.tick().result.ok());
    const TickResult refused = h.sampler.tick();
    EXPECT_EQ(refused.result.status, JournalStatus::RETRY_EXHAUSTED);
    ASSERT_TRUE(h.sampler.session().deferred_fix.has_value());
    EXPECT_EQ(h.sampler.session().deferred_fix->timestamp_ms, 2000);
    EXPECT_EQ(h.sampler.session().last_fix->timestamp_ms, 1000);
    EXPECT_TRUE(h.timer.hasPending());

    h.sink.always_fail = false;
    const TickResult retried = h.sampler.tick();
    ASSERT_TRUE(retried.result.ok());
    EXPECT_EQ(retried.fix->timestamp_ms, 2000);
    EXPECT_FALSE(h.sampler.session().deferred_fix.has_value());
    // no new capture while a refused fix was waiting
    EXPECT_EQ(h.location.fixes.size(), 1u);

    EXPECT_EQ(h.sampler.tick().fix->timestamp_ms, 3000);
    EXPECT_TRUE(h.sampler.stop().ok());
    EXPECT_EQ(timestamps(h.sink.fixes), (std::vector<std::int64_t>{0, 1000, 2000, 3000}));
}

TEST(AdaptiveSampler, StopDeliversRefusedFixAfterSinkRecovers) {
    TrackingTuning tuning;
    tuning.pending_capacity = 2;
    SamplerHarness h(tuning);
    h.location.fixes = {rawFix(48.0, 11.0, 0), rawFix(48.0, 11.0, 1000), rawFix(48.0, 11.0, 2000)};
    h.sink.always_fail = true;
    ASSERT_TRUE(h.sampler.start("trip").ok());
    h.sampler.tick();
    h.sampler.tick();
    EXPECT_FALSE(h.sampler.tick().result.ok());

    h.sink.always_fail = false;
    EXPECT_TRUE(h.sampler.stop().ok());
    EXPECT_EQ(timestamps(h.sink.fixes), (std::vector<std::int64_t>{0, 1000, 2000}));
    EXPECT_EQ(h.pipeline.pendingCount(), 0u);
}

TEST(AdaptiveSampler, StopCountsRefusedFixAsPending) {
    TrackingTuning tuning;
    tuning.pending_capacity = 1;
    tuning.flush_timeout_ms = 0;
    SamplerHarness h(tuning);
    h.location.fixes = {rawFix(48.0, 11.0, 0), rawFix(48.0, 11.0, 1000)};
    h.sink.always_fail = true;
    ASSERT_TRUE(h.sampler.start("trip").ok());
    h.sampler.tick();
    EXPECT_FALSE(h.sampler.tick().result.ok());

    const OpResult result = h.sampler.stop();
    EXPECT_EQ(result.status, JournalStatus::FLUSH_INCOMPLETE);
    EXPECT_NE(result.message.find("2 fixes pending"), std::string::npos);
    EXPECT_FALSE(h.sampler.session().deferred_fix.has_value());
}

TEST(AdaptiveSampler, ResumeDuringPauseKeepsTickScheduled) {
    TrackingTuning tuning;
    FakeLocation location;
    RecordingSink sink;
    RecordingSleeper sleeper;
    BatchRetryScheduler retry(RetryTuning{}, sleeper);
    LocationIngestPipeline pipeline(tuning, sink, retry);
    HookTimer timer;
    AdaptiveSampler sampler(tuning, location, pipeline, timer, nullptr);

    ASSERT_TRUE(sampler.start("trip").ok());
    OpResult resumed;
    timer.on_cancel = [&] { resumed = sampler.resume(); };

    EXPECT_TRUE(sampler.pause().ok());
    EXPECT_TRUE(resumed.ok());
    EXPECT_EQ(sampler.lifecycle(), Lifecycle::ACTIVE);
    EXPECT_TRUE(timer.inner.hasPending());
    EXPECT_EQ(timer.inner.pendingDelay().count(), 0);
}

TEST(AdaptiveSampler, StopInterruptsBackoffOnWorkerThread) {
    TrackingTuning tuning = fastTuning();
    tuning.pending_capacity = 1;
    tuning.flush_timeout_ms = 0;
    tuning.backpressure_timeout_ms = 60000;
    FakeLocation location;
    location.fixes = {rawFix(48.0, 11.0, 0), rawFix(48.0, 11.0, 1000)};
    RecordingSink sink;
    sink.always_fail = true;
    ThreadSleeper sleeper;
    BatchRetryScheduler retry(RetryTuning{5, 100}, sleeper);
    LocationIngestPipeline pipeline(tuning, sink, retry);
    ThreadTimer timer;
    AdaptiveSampler sampler(tuning, location, pipeline, timer, nullptr);

    ASSERT_TRUE(sampler.start("trip").ok());
    // second tick is now inside a 3100ms backoff pushing the first fix out
    ASSERT_TRUE(waitUntil([&] { return sink.append_calls >= 2; }));

    const auto begin = std::chrono::steady_clock::now();
    const OpResult result = sampler.stop();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin);

    EXPECT_LT(elapsed.count(), 1000);
    EXPECT_EQ(result.status, JournalStatus::FLUSH_INCOMPLETE);
    EXPECT_EQ(sampler.lifecycle(), Lifecycle::STOPPED);
    EXPECT_FALSE(sampler.session().hasSession());
}

TEST(AdaptiveSampler, PauseAndStopHaltWorkerThread) {
    const TrackingTuning tuning = fastTuning();
    FakeLocation location;
    for (int i = 0; i < 10000; ++i) {
        location.fixes.push_back(rawFix(48.0, 11.0, i * 1000));
    }
    RecordingSink sink;
    RecordingSleeper sleeper;
    BatchRetryScheduler retry(RetryTuning{}, sleeper);
    LocationIngestPipeline pipeline(tuning, sink, retry);
    ThreadTimer timer;
    AdaptiveSampler sampler(tuning, location, pipeline, timer, nullptr);

    ASSERT_TRUE(sampler.start("trip").ok());
    ASSERT_TRUE(waitUntil([&] { return location.requests >= 5; }));

    ASSERT_TRUE(sampler.pause().ok());
    const int paused_at = location.requests;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(location.requests, paused_at);

    ASSERT_TRUE(sampler.resume().ok());
    ASSERT_TRUE(waitUntil([&] { return location.requests >= paused_at + 5; }));

    EXPECT_TRUE(sampler.stop().ok());
    const int stopped_at = location.requests;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(location.requests, stopped_at);
    EXPECT_EQ(sampler.lifecycle(), Lifecycle::STOPPED);
    EXPECT_FALSE(sampler.session().hasSession());
    EXPECT_EQ(pipeline.pendingCount(), 0u);
    EXPECT_EQ(static_cast<int>(sink.fixes.size()), stopped_at);
}

TEST(AdaptiveSampler, StopFromListenerOnWorkerThread) {
    TrackingTuning tuning = fastTuning();
    tuning.short_stop_ms = 0;
    FakeLocation location;
    location.fixes = {rawFix(48.0, 11.0, 0)};
    RecordingSink sink;
    RecordingSleeper sleeper;
    BatchRetryScheduler retry(RetryTuning{}, sleeper);
    LocationIngestPipeline pipeline(tuning, sink, retry);
    ThreadTimer timer;
    StopOnDwellListener listener;
    AdaptiveSampler sampler(tuning, location, pipeline, timer, &listener);
    listener.sampler = &sampler;

    ASSERT_TRUE(sampler.start("trip").ok());
    ASSERT_TRUE(waitUntil([&] { return listener.done.load(); }));

    EXPECT_TRUE(listener.stop_result.ok());
    EXPECT_EQ(sampler.lifecycle(), Lifecycle::STOPPED);
    EXPECT_EQ(sampler.stop().status, JournalStatus::NO_ACTIVE_SESSION);
}
