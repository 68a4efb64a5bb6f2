#include "adaptive_sampler.hpp"

#include <chrono>
#include <iostream>

#include "geo_math.hpp"

namespace journal {
    AdaptiveSampler::AdaptiveSampler(const TrackingTuning &tuning,
                                     LocationCapability &location,
                                     LocationIngestPipeline &pipeline,
                                     SamplingTimer &timer,
                                     StepAssignmentListener *listener)
        : tuning_(tuning),
          location_(location),
          pipeline_(pipeline),
          timer_(timer),
          listener_(listener) {
    }

    AdaptiveSampler::~AdaptiveSampler() {
        timer_.cancel();
    }

    // -----------------------------------------------------------------------
    // lifecycle transitions
    // -----------------------------------------------------------------------
    OpResult AdaptiveSampler::start(const std::string &trip_id) {
        std::lock_guard lock(mutex_);
        if (stopping_ || session_.lifecycle != Lifecycle::STOPPED) {
            return OpResult::failure(JournalStatus::INVALID_TRANSITION,
                                     "already tracking trip " + session_.trip_id);
        }
        if (trip_id.empty()) {
            return OpResult::failure(JournalStatus::INVALID_TRANSITION, "empty trip id");
        }
        if (!location_.hasPermission()) {
            std::cout << "[Tracker] start refused for trip " << trip_id << ": no location permission" << std::endl;
            return OpResult::failure(JournalStatus::PERMISSION_DENIED, "location permission not granted");
        }

        pipeline_.allowRetries();
        session_ = TrackingSession{};
        session_.trip_id = trip_id;
        session_.lifecycle = Lifecycle::ACTIVE;
        session_.current_activity = MotionState::STATIONARY;
        std::cout << "[Tracker] tracking started: trip=" << trip_id << std::endl;

        // first capture right away
        scheduleLocked(0);
        return OpResult::success();
    }

    OpResult AdaptiveSampler::pause() {
        {
            std::lock_guard lock(mutex_);
            if (!session_.hasSession() || stopping_) {
                return OpResult::failure(JournalStatus::NO_ACTIVE_SESSION, "nothing to pause");
            }
            if (session_.lifecycle != Lifecycle::ACTIVE) {
                return OpResult::failure(JournalStatus::INVALID_TRANSITION,
                                         "cannot pause from " + lifecycleToString(session_.lifecycle));
            }
            session_.lifecycle = Lifecycle::PAUSED;
        }
        timer_.cancel();
        {
            // a resume() between the unlock and the cancel had its tick wiped
            std::lock_guard lock(mutex_);
            if (session_.lifecycle == Lifecycle::ACTIVE && !stopping_) {
                scheduleLocked(0);
                return OpResult::success();
            }
        }
        std::cout << "[Tracker] tracking paused" << std::endl;
        return OpResult::success();
    }

    OpResult AdaptiveSampler::resume() {
        std::lock_guard lock(mutex_);
        if (!session_.hasSession() || stopping_) {
            return OpResult::failure(JournalStatus::NO_ACTIVE_SESSION, "no trip to resume");
        }
        if (session_.lifecycle != Lifecycle::PAUSED) {
            return OpResult::failure(JournalStatus::INVALID_TRANSITION,
                                     "cannot resume from " + lifecycleToString(session_.lifecycle));
        }
        session_.lifecycle = Lifecycle::ACTIVE;
        std::cout << "[Tracker] tracking resumed: trip=" << session_.trip_id << std::endl;
        scheduleLocked(0);
        return OpResult::success();
    }

    OpResult AdaptiveSampler::stop() {
        // a tick blocked in backoff holds the lock; wake it first
        pipeline_.interruptRetries();
        {
            std::lock_guard lock(mutex_);
            if (!session_.hasSession() || stopping_) {
                if (!stopping_) {
                    pipeline_.allowRetries();
                }
                return OpResult::failure(JournalStatus::NO_ACTIVE_SESSION, "nothing to stop");
            }
            // ticks that are already waiting for the lock will see STOPPED and do nothing
            session_.lifecycle = Lifecycle::STOPPED;
            stopping_ = true;
        }
        timer_.cancel();

        std::vector<DwellEvent> events;
        OpResult result;
        {
            std::lock_guard lock(mutex_);
            pipeline_.allowRetries();

            const std::chrono::milliseconds budget(tuning_.flush_timeout_ms);
            std::chrono::milliseconds waited{0};
            OpResult flushed = pipeline_.flush(budget, &waited);
            if (flushed.ok() && session_.deferred_fix) {
                // the buffer is empty now, so the deferred fix queues without backpressure
                const IngestResult last = pipeline_.ingest(session_, *session_.deferred_fix);
                if (last.accepted) {
                    session_.deferred_fix.reset();
                    flushed = pipeline_.flush(budget > waited ? budget - waited : std::chrono::milliseconds{0});
                } else {
                    flushed = last.result;
                }
            }
            if (!flushed.ok()) {
                const size_t left = pipeline_.pendingCount() + (session_.deferred_fix ? 1 : 0);
                result = OpResult::failure(JournalStatus::FLUSH_INCOMPLETE,
                                           std::to_string(left) + " fixes pending (" + describe(flushed) + ")");
                std::cout << "[Tracker] warning: " << describe(result) << std::endl;
            }

            if (session_.dwell_state == DwellState::CONFIRMED && session_.last_fix) {
                events.push_back(makeDwellEventLocked(DwellEventKind::DWELL_ENDED, session_.last_fix->timestamp_ms));
            }

            std::cout << "[Tracker] tracking stopped: trip=" << session_.trip_id << std::endl;
            session_ = TrackingSession{};
            stopping_ = false;
        }
        notify(events);
        return result;
    }

    // -----------------------------------------------------------------------
    // sampling
    // -----------------------------------------------------------------------
    TickResult AdaptiveSampler::tick() {
        TickResult result;
        {
            std::lock_guard lock(mutex_);
            if (!session_.hasSession() || stopping_) {
                result.result = OpResult::failure(JournalStatus::NO_ACTIVE_SESSION, "tick without session");
                return result;
            }
            if (session_.lifecycle != Lifecycle::ACTIVE) {
                result.result = OpResult::failure(JournalStatus::INVALID_TRANSITION, "tick while paused");
                return result;
            }

            std::optional<RawFix> raw;
            if (session_.deferred_fix) {
                // a fix refused under backpressure goes before any new capture
                raw = session_.deferred_fix;
            } else {
                if (!location_.hasPermission()) {
                    std::cout << "[Tracker] location permission revoked, retry in "
                            << tuning_.idle_interval_ms << "ms" << std::endl;
                    result.result = OpResult::failure(JournalStatus::PERMISSION_DENIED,
                                                      "location permission revoked");
                    scheduleLocked(tuning_.idle_interval_ms);
                    return result;
                }

                raw = location_.currentFix();
                if (!raw) {
                    std::cout << "[Tracker] unable to get location, retry in "
                            << tuning_.idle_interval_ms << "ms" << std::endl;
                    result.result = OpResult::failure(JournalStatus::NO_FIX, "location capability returned no fix");
                    scheduleLocked(tuning_.idle_interval_ms);
                    return result;
                }
            }

            const std::optional<LocationFix> previous = session_.last_fix;
            IngestResult ingested = pipeline_.ingest(session_, *raw);
            result.result = ingested.result;
            result.fix = ingested.fix;

            if (!ingested.accepted && ingested.fix) {
                session_.deferred_fix = *raw;
                std::cout << "[Tracker] fix t=" << raw->timestamp_ms << " deferred until the sink catches up"
                        << std::endl;
            }
            if (ingested.accepted) {
                session_.deferred_fix.reset();
                const LocationFix &fix = *ingested.fix;
                updateBatterySaverLocked(fix.battery_level);
                updateDwellLocked(fix, previous, result.events);
                maybeSyncLocked(fix.timestamp_ms);
                std::cout << "[Tracker] fix t=" << fix.timestamp_ms
                        << ", lat=" << fix.point.latitude << ", lon=" << fix.point.longitude
                        << ", activity=" << motionStateToString(fix.activity)
                        << ", dwell=" << dwellStateToString(session_.dwell_state)
                        << ", next=" << intervalLocked() << "ms" << std::endl;
            }
            scheduleLocked(intervalLocked());
        }
        // outside the lock so a listener may call back into the sampler (e.g. stop())
        notify(result.events);
        return result;
    }

    void AdaptiveSampler::scheduleLocked(const std::int64_t delay_ms) {
        timer_.schedule(std::chrono::milliseconds(delay_ms), [this] { tick(); });
    }

    std::int64_t AdaptiveSampler::intervalLocked() const {
        if (session_.battery_saver) {
            return tuning_.stationary_interval_ms;
        }
        return isMoving(session_.current_activity) ? tuning_.active_interval_ms : tuning_.stationary_interval_ms;
    }

    void AdaptiveSampler::updateBatterySaverLocked(const std::optional<double> &battery_level) {
        if (!battery_level) {
            return;
        }
        const bool saver = *battery_level < tuning_.battery_saver_threshold;
        if (saver != session_.battery_saver) {
            std::cout << "[Tracker] battery " << *battery_level << ": battery saver "
                    << (saver ? "on" : "off") << std::endl;
            session_.battery_saver = saver;
        }
    }

    // -----------------------------------------------------------------------
    // dwell detection
    // -----------------------------------------------------------------------
    void AdaptiveSampler::resetDwellLocked() {
        session_.dwell_started_at.reset();
        session_.dwell_anchor.reset();
        session_.dwell_state = DwellState::NONE;
    }

    DwellEvent AdaptiveSampler::makeDwellEventLocked(const DwellEventKind kind, const std::int64_t at_ms) const {
        DwellEvent event;
        event.kind = kind;
        event.trip_id = session_.trip_id;
        event.location = session_.dwell_anchor.value_or(GeoPoint{});
        event.started_at_ms = session_.dwell_started_at.value_or(at_ms);
        event.at_ms = at_ms;
        return event;
    }

    void AdaptiveSampler::updateDwellLocked(const LocationFix &fix, const std::optional<LocationFix> &previous,
                                            std::vector<DwellEvent> &events) {
        if (fix.activity != MotionState::STATIONARY) {
            if (session_.dwell_state == DwellState::CONFIRMED) {
                events.push_back(makeDwellEventLocked(DwellEventKind::DWELL_ENDED, fix.timestamp_ms));
            }
            resetDwellLocked();
            return;
        }

        if (session_.dwell_anchor &&
            GeoMath::distanceMeters(*session_.dwell_anchor, fix.point) > tuning_.stationary_radius_m) {
            // drifted away while still "stationary": the old run ends here
            if (session_.dwell_state == DwellState::CONFIRMED) {
                events.push_back(makeDwellEventLocked(DwellEventKind::DWELL_ENDED, fix.timestamp_ms));
            }
            resetDwellLocked();
            session_.dwell_started_at = fix.timestamp_ms;
            session_.dwell_anchor = fix.point;
        }

        if (!session_.dwell_started_at) {
            // stationary since the fix this one was compared against
            session_.dwell_started_at = previous ? previous->timestamp_ms : fix.timestamp_ms;
            session_.dwell_anchor = previous ? previous->point : fix.point;
        }

        const std::int64_t elapsed = fix.timestamp_ms - *session_.dwell_started_at;
        if (session_.dwell_state == DwellState::NONE && elapsed >= tuning_.short_stop_ms) {
            session_.dwell_state = DwellState::CANDIDATE;
            events.push_back(makeDwellEventLocked(DwellEventKind::VISIT_CANDIDATE, fix.timestamp_ms));
        }
        if (session_.dwell_state == DwellState::CANDIDATE && elapsed >= tuning_.min_dwell_ms) {
            session_.dwell_state = DwellState::CONFIRMED;
            events.push_back(makeDwellEventLocked(DwellEventKind::DWELL_CONFIRMED, fix.timestamp_ms));
        }
    }

    void AdaptiveSampler::maybeSyncLocked(const std::int64_t now_ms) {
        if (!session_.last_sync_ms) {
            session_.last_sync_ms = now_ms;
        }
        const bool batch_ready = pipeline_.pendingCount() >= static_cast<size_t>(tuning_.sync_batch_size);
        const bool interval_elapsed = now_ms - *session_.last_sync_ms >= tuning_.sync_interval_ms;
        if (!batch_ready && !interval_elapsed) {
            return;
        }
        session_.last_sync_ms = now_ms;
        const OpResult flushed = pipeline_.flush(std::chrono::milliseconds(tuning_.flush_timeout_ms));
        if (!flushed.ok()) {
            // data stays buffered for the next opportunity
            std::cout << "[Tracker] periodic sync incomplete: " << describe(flushed) << std::endl;
        }
    }

    void AdaptiveSampler::notify(const std::vector<DwellEvent> &events) {
        for (const auto &event: events) {
            std::cout << "[Tracker] dwell event: " << dwellEventKindToString(event.kind)
                    << ", trip=" << event.trip_id
                    << ", since=" << event.started_at_ms
                    << ", duration=" << event.durationMs() << "ms" << std::endl;
            if (listener_) {
                listener_->onDwellEvent(event);
            }
        }
    }

    // -----------------------------------------------------------------------
    // queries
    // -----------------------------------------------------------------------
    TrackingSession AdaptiveSampler::session() const {
        std::lock_guard lock(mutex_);
        return session_;
    }

    Lifecycle AdaptiveSampler::lifecycle() const {
        std::lock_guard lock(mutex_);
        return session_.lifecycle;
    }

    std::int64_t AdaptiveSampler::nextIntervalMs() const {
        std::lock_guard lock(mutex_);
        return intervalLocked();
    }

    SamplingRequest AdaptiveSampler::currentRequest() const {
        std::lock_guard lock(mutex_);
        SamplingRequest request;
        request.interval_ms = intervalLocked();
        request.distance_filter_m = tuning_.min_displacement_m;
        if (session_.battery_saver) {
            request.desired_accuracy_m = tuning_.low_accuracy_m;
        } else if (isMoving(session_.current_activity)) {
            request.desired_accuracy_m = tuning_.high_accuracy_m;
        } else {
            request.desired_accuracy_m = tuning_.medium_accuracy_m;
        }
        return request;
    }
} // namespace journal
