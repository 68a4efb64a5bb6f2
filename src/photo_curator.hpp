#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "journal_config.hpp"
#include "journal_interfaces.hpp"
#include "journal_status.hpp"
#include "photo_cluster.hpp"
#include "photo_cluster_engine.hpp"
#include "quality_gate.hpp"
#include "retry_scheduler.hpp"

namespace journal {
    struct CurationResult {
        int photos_processed = 0;
        int photos_added = 0;
        int photos_filtered = 0;
        int clusters_created = 0;
        int clusters_delivered = 0;
        int highlights = 0;
        std::vector<PhotoCluster> clusters;
        /// First sink failure, OK when every cluster was delivered.
        OpResult status;
    };

    /// Gate -> cluster -> deliver for the photos of one trip.
    class PhotoCurator {
    public:
        PhotoCurator(const CurationTuning &tuning,
                     JournalSink &sink,
                     BatchRetryScheduler &retry,
                     StepAssignmentListener *listener = nullptr);

        /// Photos taken before @p since_ms (the trip start) are ignored.
        CurationResult curateTripPhotos(const std::vector<PhotoRecord> &photos,
                                        const std::string &trip_id,
                                        std::int64_t since_ms = 0);

        static void assignClusterToStep(PhotoCluster &cluster, const std::string &step_id);

        [[nodiscard]] const QualityGate &gate() const { return gate_; }

    private:
        QualityGate gate_;
        PhotoClusterEngine engine_;
        JournalSink &sink_;
        BatchRetryScheduler &retry_;
        StepAssignmentListener *listener_;
    };
} // namespace journal
