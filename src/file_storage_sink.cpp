#include "file_storage_sink.hpp"

#include <opencv2/core.hpp>

#include <iostream>
#include <stdexcept>

namespace journal {
    namespace {
        // FileStorage has no 64-bit integer node; epoch millis fit a double exactly
        double toStorage(const std::int64_t millis) {
            return static_cast<double>(millis);
        }

        void writeFix(cv::FileStorage &fs, const LocationFix &fix) {
            fs << "{";
            fs << "trip" << fix.trip_id;
            fs << "t" << toStorage(fix.timestamp_ms);
            fs << "lat" << fix.point.latitude;
            fs << "lon" << fix.point.longitude;
            fs << "activity" << motionStateToString(fix.activity);
            if (fix.accuracy) {
                fs << "accuracy" << *fix.accuracy;
            }
            if (fix.speed) {
                fs << "speed" << *fix.speed;
            }
            if (fix.battery_level) {
                fs << "battery" << *fix.battery_level;
            }
            fs << "}";
        }

        void writeCluster(cv::FileStorage &fs, const PhotoCluster &cluster) {
            fs << "{";
            fs << "id" << cluster.id();
            fs << "trip" << cluster.tripId();
            fs << "start" << toStorage(cluster.startTime());
            fs << "end" << toStorage(cluster.endTime());
            fs << "lat" << cluster.centerLocation().latitude;
            fs << "lon" << cluster.centerLocation().longitude;
            fs << "has_center" << static_cast<int>(cluster.hasCenterLocation());
            if (cluster.assignedStepId()) {
                fs << "step" << *cluster.assignedStepId();
            }
            fs << "photos" << "[";
            for (const auto &photo: cluster.photos()) {
                fs << photo.id;
            }
            fs << "]";
            fs << "}";
        }
    }

    FileStorageSink::FileStorageSink(std::string output_path, const int simulated_failures)
        : output_path_(std::move(output_path)),
          remaining_failures_(simulated_failures > 0 ? simulated_failures : 0) {
    }

    FileStorageSink::~FileStorageSink() {
        try {
            close();
        } catch (const std::exception &e) {
            std::cerr << "[Error] [Sink] " << e.what() << std::endl;
        }
    }

    bool FileStorageSink::consumeFailureLocked() {
        if (remaining_failures_ <= 0) {
            return false;
        }
        --remaining_failures_;
        return true;
    }

    OpResult FileStorageSink::append(const LocationFix &fix) {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return OpResult::failure(JournalStatus::SINK_ERROR, "sink closed");
        }
        if (consumeFailureLocked()) {
            return OpResult::failure(JournalStatus::SINK_ERROR, "backend unavailable");
        }
        fixes_.push_back(fix);
        return OpResult::success();
    }

    OpResult FileStorageSink::appendCluster(const PhotoCluster &cluster) {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return OpResult::failure(JournalStatus::SINK_ERROR, "sink closed");
        }
        if (consumeFailureLocked()) {
            return OpResult::failure(JournalStatus::SINK_ERROR, "backend unavailable");
        }
        clusters_.push_back(cluster);
        return OpResult::success();
    }

    void FileStorageSink::close() {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;

        cv::FileStorage fs(output_path_, cv::FileStorage::WRITE);
        if (!fs.isOpened()) {
            throw std::runtime_error("cannot write journal output: " + output_path_);
        }
        fs << "fixes" << "[";
        for (const auto &fix: fixes_) {
            writeFix(fs, fix);
        }
        fs << "]";
        fs << "clusters" << "[";
        for (const auto &cluster: clusters_) {
            writeCluster(fs, cluster);
        }
        fs << "]";
        fs.release();

        std::cout << "[Sink] written: " << output_path_ << ", fixes=" << fixes_.size()
                << ", clusters=" << clusters_.size() << std::endl;
    }

    size_t FileStorageSink::fixCount() const {
        std::lock_guard lock(mutex_);
        return fixes_.size();
    }

    size_t FileStorageSink::clusterCount() const {
        std::lock_guard lock(mutex_);
        return clusters_.size();
    }
} // namespace journal
