#include "patch_log.hpp"

#include "util/file_io.hpp"

#include <fmt/format.h>

#include <ctime>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using namespace sturdy;

void
sturdy::PatchLog::log(const std::string& message) {
    if (echo_) {
        fmt::print("{}\n", message);
    }
    lines_.push_back(message);
}

ProgressSink
sturdy::PatchLog::sink() {
    return [this](const std::string& message) { log(message); };
}

std::string
sturdy::PatchLog::text() const {
    std::string result;
    for (const auto& line : lines_) {
        result += line;
        result += '\n';
    }
    return result;
}

bool
sturdy::PatchLog::save(const std::string& log_dir, std::string& path) const {
    if (lines_.empty()) {
        return false;
    }
    path = (fs::path(log_dir) / log_file_name(std::time(nullptr))).string();
    return write_file(path, text());
}

std::string
sturdy::log_file_name(std::time_t when) {
    char stamp[64];
    struct tm* ltime = std::localtime(&when);
    if (ltime == nullptr || std::strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", ltime) == 0) {
        return fmt::format("sturdy_patcher_log_{}.txt", static_cast<long long>(when));
    }
    return fmt::format("sturdy_patcher_log_{}.txt", stamp);
}
