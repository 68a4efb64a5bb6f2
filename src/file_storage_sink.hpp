#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "journal_interfaces.hpp"
#include "journal_types.hpp"
#include "photo_cluster.hpp"

namespace journal {
    /// JournalSink that keeps everything in memory and writes one cv::FileStorage document
    /// (.yml or .json, by extension) on close(). The first @p simulated_failures calls fail
    /// with SINK_ERROR to stand in for an unreachable backend.
    class FileStorageSink final : public JournalSink {
    public:
        explicit FileStorageSink(std::string output_path, int simulated_failures = 0);

        ~FileStorageSink() override;

        FileStorageSink(const FileStorageSink &) = delete;

        FileStorageSink &operator=(const FileStorageSink &) = delete;

        OpResult append(const LocationFix &fix) override;

        OpResult appendCluster(const PhotoCluster &cluster) override;

        /// Write the document. Throws std::runtime_error when the file cannot be opened.
        void close();

        [[nodiscard]] size_t fixCount() const;

        [[nodiscard]] size_t clusterCount() const;

    private:
        bool consumeFailureLocked();

        std::string output_path_;
        int remaining_failures_;
        bool closed_ = false;

        mutable std::mutex mutex_;
        std::vector<LocationFix> fixes_;
        std::vector<PhotoCluster> clusters_;
    };
} // namespace journal
