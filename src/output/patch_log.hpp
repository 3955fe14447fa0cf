#pragma once

#include "processing/patch.hpp"

#include <ctime>
#include <string>
#include <vector>

namespace sturdy {

// Collects the narration of a patch run. Lines are echoed to stdout when
// `echo` is set and can be written to a timestamped file afterwards.
class PatchLog {
   public:
    explicit PatchLog(bool echo) : echo_(echo) {
    }

    void
    log(const std::string& message);

    ProgressSink
    sink();

    const std::vector<std::string>&
    lines() const {
        return lines_;
    }

    std::string
    text() const;

    // Writes <log_dir>/sturdy_patcher_log_<timestamp>.txt. Returns false
    // for an empty log or when writing fails; `path` receives the file name.
    bool
    save(const std::string& log_dir, std::string& path) const;

   private:
    bool echo_;
    std::vector<std::string> lines_;
};

std::string
log_file_name(std::time_t when);

}  // namespace sturdy
