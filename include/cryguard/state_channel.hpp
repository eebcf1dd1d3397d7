#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "cryguard/calibration.hpp"
#include "cryguard/parameters.hpp"
#include "cryguard/score_types.hpp"

namespace cryguard {

// Whole-document state exchanged between the monitor and command processes.
struct Snapshot {
    std::string writer;                    // "monitor" or "command"
    double updated_at{0.0};                // wall clock seconds
    CalibrationState calibration;
    Thresholds effective;
    std::optional<OutcomeSummary> last_outcome;
    std::optional<double> last_confirmed_at;
    uint64_t windows_processed{0};
};

std::string encode_snapshot(const Snapshot& snapshot);
// Empty for torn or otherwise unparsable documents.
std::optional<Snapshot> decode_snapshot(const std::string& document);

// One snapshot file with a single writer. Writes go to a temporary file and
// are renamed into place, so readers see either the old or the new document.
class StateChannel {
public:
    explicit StateChannel(const std::string& path);

    // Throws StateChannelUnavailable when the document cannot be written.
    void publish(const Snapshot& snapshot);
    // Empty when the file is absent or torn ("unknown, retry"). Throws
    // StateChannelUnavailable when the file exists but cannot be read.
    std::optional<Snapshot> read() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

constexpr const char* kControlFile = "calibration_control.json";
constexpr const char* kStatusFile = "monitor_status.json";

std::string control_channel_path(const std::string& artifact_dir);
std::string status_channel_path(const std::string& artifact_dir);

}  // namespace cryguard
