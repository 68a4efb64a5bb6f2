#include "record_reader.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace journal {
    namespace {
        std::vector<std::string> splitFields(const std::string &line) {
            std::istringstream iss(line);
            std::vector<std::string> parts;
            std::string part;
            while (iss >> part) {
                parts.push_back(part);
            }
            return parts;
        }

        bool isCommentOrBlank(const std::string &line) {
            const auto first = line.find_first_not_of(" \t\r");
            return first == std::string::npos || line[first] == '#';
        }

        std::optional<double> optionalField(const std::vector<std::string> &parts, const size_t index) {
            if (index >= parts.size() || parts[index] == "-") {
                return std::nullopt;
            }
            return std::stod(parts[index]);
        }

        bool parseBool(const std::string &text) {
            if (text == "1" || text == "true" || text == "TRUE") {
                return true;
            }
            if (text == "0" || text == "false" || text == "FALSE") {
                return false;
            }
            throw std::invalid_argument("not a boolean: " + text);
        }

        template<typename Record, typename Parser>
        std::vector<Record> loadRecords(const std::string &path, const char *kind, Parser parser) {
            std::ifstream file(path);
            if (!file.is_open()) {
                throw std::runtime_error(std::string(kind) + " file not found: " + path);
            }

            std::vector<Record> records;
            std::string line;
            int total_lines = 0;
            int skipped_lines = 0;

            std::cout << "[Reader] reading " << kind << ": " << path << std::endl;
            while (std::getline(file, line)) {
                ++total_lines;
                Record record;
                if (!parser(line, record)) {
                    ++skipped_lines;
                    continue;
                }
                records.push_back(std::move(record));
            }

            std::cout << "[Reader] done: records=" << records.size()
                    << ", total_lines=" << total_lines << ", skipped=" << skipped_lines << std::endl;
            return records;
        }
    } // namespace

    bool PhotoManifestReader::parseLine(const std::string &line, PhotoRecord &record) {
        if (isCommentOrBlank(line)) {
            return false;
        }
        const auto parts = splitFields(line);
        if (parts.size() < 8) {
            return false;
        }
        try {
            PhotoRecord parsed;
            parsed.id = parts[0];
            parsed.timestamp_ms = std::stoll(parts[1]);
            const auto latitude = optionalField(parts, 2);
            const auto longitude = optionalField(parts, 3);
            if (latitude.has_value() != longitude.has_value()) {
                return false;
            }
            if (latitude && longitude) {
                parsed.location = GeoPoint{*latitude, *longitude};
                if (!parsed.location->isValid()) {
                    return false;
                }
            }
            parsed.quality_score = std::stod(parts[4]);
            parsed.is_junk = parseBool(parts[5]);
            parsed.width = std::stoi(parts[6]);
            parsed.height = std::stoi(parts[7]);
            parsed.junk_score = optionalField(parts, 8);
            record = std::move(parsed);
            return true;
        } catch (const std::logic_error &) {
            // std::stod and friends throw invalid_argument / out_of_range
            return false;
        }
    }

    bool TrackReader::parseLine(const std::string &line, RawFix &fix) {
        if (isCommentOrBlank(line)) {
            return false;
        }
        const auto parts = splitFields(line);
        if (parts.size() < 3) {
            return false;
        }
        try {
            RawFix parsed;
            parsed.timestamp_ms = std::stoll(parts[0]);
            parsed.point.latitude = std::stod(parts[1]);
            parsed.point.longitude = std::stod(parts[2]);
            parsed.accuracy = optionalField(parts, 3);
            parsed.altitude = optionalField(parts, 4);
            parsed.speed = optionalField(parts, 5);
            parsed.heading = optionalField(parts, 6);
            parsed.battery_level = optionalField(parts, 7);
            fix = parsed;
            return true;
        } catch (const std::logic_error &) {
            return false;
        }
    }

    std::vector<PhotoRecord> PhotoManifestReader::load(const std::string &manifest_path) {
        return loadRecords<PhotoRecord>(manifest_path, "photo manifest", &PhotoManifestReader::parseLine);
    }

    std::vector<RawFix> TrackReader::load(const std::string &track_path) {
        return loadRecords<RawFix>(track_path, "track", &TrackReader::parseLine);
    }
} // namespace journal
