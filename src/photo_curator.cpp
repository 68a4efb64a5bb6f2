#include "photo_curator.hpp"

#include <iostream>

namespace journal {
    PhotoCurator::PhotoCurator(const CurationTuning &tuning,
                               JournalSink &sink,
                               BatchRetryScheduler &retry,
                               StepAssignmentListener *listener)
        : gate_(tuning),
          engine_(tuning),
          sink_(sink),
          retry_(retry),
          listener_(listener) {
    }

    CurationResult PhotoCurator::curateTripPhotos(const std::vector<PhotoRecord> &photos,
                                                  const std::string &trip_id,
                                                  const std::int64_t since_ms) {
        CurationResult result;

        std::vector<PhotoRecord> kept;
        kept.reserve(photos.size());
        for (const auto &photo: photos) {
            if (photo.timestamp_ms < since_ms) {
                continue;
            }
            ++result.photos_processed;
            if (!gate_.passes(photo)) {
                ++result.photos_filtered;
                continue;
            }
            if (gate_.isHighlight(photo)) {
                ++result.highlights;
            }
            kept.push_back(photo);
        }
        result.photos_added = static_cast<int>(kept.size());

        result.clusters = engine_.cluster(kept, trip_id);
        result.clusters_created = static_cast<int>(result.clusters.size());

        for (const auto &cluster: result.clusters) {
            RetryableOperation<const PhotoCluster *> op{&cluster};
            const OpResult delivered = retry_.execute(op, [this](const PhotoCluster *c) {
                return sink_.appendCluster(*c);
            });
            if (delivered.ok()) {
                ++result.clusters_delivered;
            } else {
                std::cerr << "[Error] [Curate] cluster " << cluster.id() << " not delivered: "
                        << describe(delivered) << std::endl;
                if (result.status.ok()) {
                    result.status = delivered;
                }
            }
            // the step owner gets every cluster, delivered or not
            if (listener_) {
                listener_->onClusterFinalized(cluster);
            }
        }

        std::cout << "[Curate] trip=" << trip_id
                << ", processed=" << result.photos_processed
                << ", added=" << result.photos_added
                << ", filtered=" << result.photos_filtered
                << ", highlights=" << result.highlights
                << ", clusters=" << result.clusters_delivered << "/" << result.clusters_created << std::endl;
        return result;
    }

    void PhotoCurator::assignClusterToStep(PhotoCluster &cluster, const std::string &step_id) {
        cluster.assignToStep(step_id);
        std::cout << "[Curate] cluster " << cluster.id() << " -> step " << step_id << std::endl;
    }
} // namespace journal
