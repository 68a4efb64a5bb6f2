#include "location_ingest.hpp"

#include <iostream>

#include "geo_math.hpp"

namespace journal {
    LocationIngestPipeline::LocationIngestPipeline(const TrackingTuning &tuning, JournalSink &sink,
                                                   BatchRetryScheduler &retry)
        : classifier_(tuning),
          sink_(sink),
          retry_(retry),
          pending_(static_cast<size_t>(tuning.pending_capacity > 0 ? tuning.pending_capacity : 1)),
          backpressure_budget_(tuning.backpressure_timeout_ms > 0 ? tuning.backpressure_timeout_ms : 0) {
    }

    LocationFix LocationIngestPipeline::buildFix(const TrackingSession &session, const RawFix &raw) const {
        LocationFix fix;
        fix.trip_id = session.trip_id;
        fix.point = raw.point;
        fix.timestamp_ms = raw.timestamp_ms;
        fix.accuracy = raw.accuracy;
        fix.altitude = raw.altitude;
        fix.speed = raw.speed;
        fix.heading = raw.heading;
        fix.battery_level = raw.battery_level;
        fix.activity = session.current_activity;

        if (session.last_fix) {
            const auto &prev = *session.last_fix;
            const double speed = GeoMath::speedMps(prev.point, raw.point, prev.timestamp_ms, raw.timestamp_ms);
            fix.activity = classifier_.classify(speed);
            if (!fix.speed) {
                fix.speed = speed;
            }
            if (!fix.heading && GeoMath::distanceMeters(prev.point, raw.point) > 0.0) {
                fix.heading = GeoMath::bearingDegrees(prev.point, raw.point);
            }
        }
        return fix;
    }

    IngestResult LocationIngestPipeline::ingest(TrackingSession &session, const RawFix &raw) {
        if (!raw.point.isValid()) {
            std::cerr << "[Error] [Ingest] discarded fix t=" << raw.timestamp_ms
                    << ": lat=" << raw.point.latitude << ", lon=" << raw.point.longitude
                    << " out of range" << std::endl;
            return {
                OpResult::failure(JournalStatus::INVALID_COORDINATE,
                                  "lat=" + std::to_string(raw.point.latitude) +
                                  ", lon=" + std::to_string(raw.point.longitude)),
                std::nullopt,
                false
            };
        }

        LocationFix fix = buildFix(session, raw);

        if (!pending_.push(fix)) {
            std::cout << "[Ingest] pending buffer full (" << pending_.capacity()
                    << "), pushing oldest fix to sink" << std::endl;
            std::chrono::milliseconds waited{0};
            const OpResult delivered = deliverOldest(backpressure_budget_, waited);
            if (!delivered.ok()) {
                std::cout << "[Ingest] backpressure: fix t=" << fix.timestamp_ms
                        << " not accepted, " << describe(delivered) << std::endl;
                return {delivered, fix, false};
            }
            if (!pending_.push(fix)) {
                std::cerr << "[Error] [Ingest] fix t=" << fix.timestamp_ms
                        << " not queued: buffer still full after delivery" << std::endl;
                return {
                    OpResult::failure(JournalStatus::SINK_ERROR, "pending buffer still full"),
                    fix,
                    false
                };
            }
        }

        session.last_fix = fix;
        session.current_activity = fix.activity;
        return {OpResult::success(), fix, true};
    }

    OpResult LocationIngestPipeline::deliverOldest(const std::optional<std::chrono::milliseconds> budget,
                                                   std::chrono::milliseconds &waited) {
        const auto head = pending_.front();
        if (!head) {
            return OpResult::success();
        }

        RetryableOperation<LocationFix> op{*head};
        OpResult result = retry_.execute(op, [this](const LocationFix &fix) { return sink_.append(fix); }, budget);
        waited += op.waited;
        if (result.ok()) {
            pending_.popFront();
        }
        return result;
    }

    OpResult LocationIngestPipeline::flush(const std::optional<std::chrono::milliseconds> budget,
                                           std::chrono::milliseconds *waited) {
        if (waited) {
            *waited = std::chrono::milliseconds{0};
        }
        if (pending_.empty()) {
            return OpResult::success();
        }

        const size_t before = pending_.size();
        std::chrono::milliseconds spent{0};
        while (!pending_.empty()) {
            std::optional<std::chrono::milliseconds> remaining;
            if (budget) {
                remaining = *budget > spent ? *budget - spent : std::chrono::milliseconds{0};
            }
            const OpResult delivered = deliverOldest(remaining, spent);
            if (waited) {
                *waited = spent;
            }
            if (!delivered.ok()) {
                std::cout << "[Sync] flush stopped: delivered=" << (before - pending_.size())
                        << ", pending=" << pending_.size() << ", " << describe(delivered) << std::endl;
                return delivered;
            }
        }

        std::cout << "[Sync] flushed " << before << " fixes" << std::endl;
        return OpResult::success();
    }
} // namespace journal
