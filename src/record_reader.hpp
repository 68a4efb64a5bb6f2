#pragma once

#include <string>
#include <vector>

#include "journal_types.hpp"

namespace journal {
    /// Photo manifest, one photo per line:
    ///   id timestamp_ms latitude longitude quality is_junk width height [junk_score]
    /// "-" for latitude and longitude means the photo has no location.
    class PhotoManifestReader {
    public:
        static std::vector<PhotoRecord> load(const std::string &manifest_path);

        /// Parse one line. Returns false for lines that do not describe a photo.
        static bool parseLine(const std::string &line, PhotoRecord &record);
    };

    /// Recorded track, one fix per line:
    ///   timestamp_ms latitude longitude [accuracy altitude speed heading battery]
    /// "-" marks an absent optional field.
    class TrackReader {
    public:
        static std::vector<RawFix> load(const std::string &track_path);

        static bool parseLine(const std::string &line, RawFix &fix);
    };
} // namespace journal
