#include "journal_status.hpp"

namespace journal {
    std::string journalStatusToString(const JournalStatus status) {
        switch (status) {
            case JournalStatus::OK:
                return "OK";
            case JournalStatus::PERMISSION_DENIED:
                return "location permission denied";
            case JournalStatus::NO_ACTIVE_SESSION:
                return "no active session";
            case JournalStatus::INVALID_TRANSITION:
                return "invalid transition";
            case JournalStatus::INVALID_COORDINATE:
                return "invalid coordinate";
            case JournalStatus::NO_FIX:
                return "no fix available";
            case JournalStatus::SINK_ERROR:
                return "sink error";
            case JournalStatus::RETRY_EXHAUSTED:
                return "retry exhausted";
            case JournalStatus::CANCELLED:
                return "cancelled";
            case JournalStatus::TIMED_OUT:
                return "timed out";
            case JournalStatus::FLUSH_INCOMPLETE:
                return "flush incomplete";
            default:
                return "unknown error";
        }
    }

    std::string describe(const OpResult &result) {
        if (result.message.empty()) {
            return journalStatusToString(result.status);
        }
        return journalStatusToString(result.status) + ": " + result.message;
    }
} // namespace journal
