#include "journal_app.hpp"

#include <opencv2/core/utils/logging.hpp>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "adaptive_sampler.hpp"
#include "file_storage_sink.hpp"
#include "journal_config.hpp"
#include "location_ingest.hpp"
#include "photo_curator.hpp"
#include "record_reader.hpp"
#include "retry_scheduler.hpp"
#include "sampling_timer.hpp"

using namespace journal;

namespace {
    /// Feeds a recorded track to the sampler, one fix per tick.
    class ReplayLocation final : public LocationCapability {
    public:
        explicit ReplayLocation(std::vector<RawFix> track) : track_(std::move(track)) {
        }

        bool hasPermission() override { return true; }

        std::optional<RawFix> currentFix() override {
            if (next_ >= track_.size()) {
                return std::nullopt;
            }
            return track_[next_++];
        }

        [[nodiscard]] bool exhausted() const { return next_ >= track_.size(); }

    private:
        std::vector<RawFix> track_;
        size_t next_ = 0;
    };

    class LoggingStepListener final : public StepAssignmentListener {
    public:
        void onClusterFinalized(const PhotoCluster &cluster) override {
            std::cout << "[Main] cluster " << cluster.id()
                    << ": photos=" << cluster.size()
                    << ", start=" << cluster.startTime()
                    << ", end=" << cluster.endTime();
            if (cluster.hasCenterLocation()) {
                std::cout << ", center=(" << cluster.centerLocation().latitude
                        << ", " << cluster.centerLocation().longitude << ")";
            } else {
                std::cout << ", center=none";
            }
            std::cout << std::endl;
        }

        void onDwellEvent(const DwellEvent &event) override {
            std::cout << "[Main] " << dwellEventKindToString(event.kind)
                    << " at (" << event.location.latitude << ", " << event.location.longitude << ")"
                    << ", duration=" << event.durationMs() / 1000 << "s" << std::endl;
        }
    };

    std::string envStringOr(const char *name, const std::string &default_value) {
        const char *value = std::getenv(name);
        return value ? std::string(value) : default_value;
    }

    int envFailuresOr(const char *name, const int default_value) {
        const char *value = std::getenv(name);
        if (!value) {
            return default_value;
        }
        char *end = nullptr;
        const long parsed = std::strtol(value, &end, 10);
        if (end == value || *end != '\0' || parsed < 0) {
            return default_value;
        }
        return static_cast<int>(parsed);
    }

    JournalTuning loadTuningFromEnvironment() {
        JournalTuning tuning = loadJournalTuning(envStringOr("JOURNAL_PROFILE", "balanced"));
        const std::string config_path = envStringOr("JOURNAL_CONFIG", "");
        if (!config_path.empty()) {
            loadJournalTuningFile(config_path, tuning);
        }
        applyEnvironmentOverrides(tuning);
        return tuning;
    }

    void printUsage() {
        std::cerr << "usage:\n"
                << "  trip_journal curate <photo_manifest> <trip_id> [output.yml]\n"
                << "  trip_journal replay <track_file> <trip_id> [output.yml]" << std::endl;
    }

    int runCurate(const JournalTuning &tuning, const std::string &manifest_path,
                  const std::string &trip_id, const std::string &output_path) {
        const auto photos = PhotoManifestReader::load(manifest_path);
        std::cout << "[Main] photos: " << photos.size() << std::endl;

        ThreadSleeper sleeper;
        BatchRetryScheduler retry(tuning.retry, sleeper);
        FileStorageSink sink(output_path, envFailuresOr("JOURNAL_SIMULATED_SINK_FAILURES", 0));
        LoggingStepListener listener;
        PhotoCurator curator(tuning.curation, sink, retry, &listener);

        CurationResult result = curator.curateTripPhotos(photos, trip_id);
        for (size_t i = 0; i < result.clusters.size(); ++i) {
            PhotoCurator::assignClusterToStep(result.clusters[i], trip_id + "-step-" + std::to_string(i));
            const auto selection = curator.gate().curateStep(result.clusters[i].photos());
            std::cout << "[Main]   step " << i << ": kept=" << selection.photos.size() << ", featured=";
            for (size_t k = 0; k < selection.featured.size(); ++k) {
                std::cout << (k ? "," : "") << selection.featured[k].id;
            }
            std::cout << std::endl;
        }
        sink.close();

        if (!result.status.ok()) {
            std::cerr << "[Error] " << describe(result.status) << std::endl;
            return 2;
        }
        return 0;
    }

    int runReplay(const JournalTuning &tuning, const std::string &track_path,
                  const std::string &trip_id, const std::string &output_path) {
        ReplayLocation location(TrackReader::load(track_path));

        ThreadSleeper sleeper;
        BatchRetryScheduler retry(tuning.retry, sleeper);
        FileStorageSink sink(output_path, envFailuresOr("JOURNAL_SIMULATED_SINK_FAILURES", 0));
        LocationIngestPipeline pipeline(tuning.tracking, sink, retry);
        ManualTimer timer;
        LoggingStepListener listener;
        AdaptiveSampler sampler(tuning.tracking, location, pipeline, timer, &listener);

        const OpResult started = sampler.start(trip_id);
        if (!started.ok()) {
            std::cerr << "[Error] " << describe(started) << std::endl;
            return 2;
        }
        // one recorded fix per wake-up, the requested interval is only logged
        int ticks = 0;
        while (!location.exhausted() && timer.fire()) {
            ++ticks;
        }
        std::cout << "[Main] replayed ticks: " << ticks << std::endl;

        const OpResult stopped = sampler.stop();
        sink.close();
        if (!stopped.ok()) {
            std::cerr << "[Error] " << describe(stopped) << std::endl;
            return 2;
        }
        return 0;
    }
}

int runJournalApplication(const int argc, char **argv) {
    cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_SILENT);

    if (argc < 4) {
        printUsage();
        return 1;
    }
    const std::string mode = argv[1];
    const std::string input_path = argv[2];
    const std::string trip_id = argv[3];
    const std::string output_path = argc > 4 ? argv[4] : trip_id + "_journal.yml";

    try {
        const JournalTuning tuning = loadTuningFromEnvironment();
        logJournalTuning(tuning);

        std::cout << "[Main] mode: " << mode << std::endl;
        std::cout << "[Main] input: " << input_path << std::endl;
        std::cout << "[Main] trip: " << trip_id << std::endl;
        std::cout << "[Main] output: " << output_path << std::endl;

        if (mode == "curate") {
            return runCurate(tuning, input_path, trip_id, output_path);
        }
        if (mode == "replay") {
            return runReplay(tuning, input_path, trip_id, output_path);
        }
        printUsage();
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "[Error] " << e.what() << std::endl;
        return 1;
    }
}
