#pragma once

#include <string>
#include <utility>

namespace journal {
    enum class JournalStatus {
        OK,
        PERMISSION_DENIED,
        NO_ACTIVE_SESSION,
        INVALID_TRANSITION,
        INVALID_COORDINATE,
        NO_FIX,
        SINK_ERROR,
        RETRY_EXHAUSTED,
        CANCELLED,
        TIMED_OUT,
        FLUSH_INCOMPLETE  // warning: stop() completed with data still pending
    };

    std::string journalStatusToString(JournalStatus status);

    struct OpResult {
        JournalStatus status = JournalStatus::OK;
        std::string message;

        [[nodiscard]] bool ok() const { return status == JournalStatus::OK; }

        static OpResult success() { return {}; }

        static OpResult failure(const JournalStatus status, std::string message) {
            return {status, std::move(message)};
        }
    };

    /// "<status>: <message>" for log lines.
    std::string describe(const OpResult &result);
} // namespace journal
