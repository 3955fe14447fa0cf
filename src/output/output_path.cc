#include "output_path.hpp"

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

struct Version {
    int64_t major = 0;
    int64_t minor = 0;

    bool
    operator>(const Version& other) const {
        return major > other.major || (major == other.major && minor > other.minor);
    }
};

// Parse a leading run of digits starting at `pos`. A run that does not fit
// in an int is not a version number.
std::optional<int>
parse_number(const std::string& s, std::string::size_type& pos) {
    auto start = pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        pos++;
    }
    if (pos == start) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data() + start, s.data() + pos, value);
    if (ec != std::errc() || ptr != s.data() + pos) {
        return std::nullopt;
    }
    return value;
}

// Match "<base>_v<major>.<minor>" at the start of `stem`.
std::optional<Version>
parse_version(const std::string& stem, const std::string& base) {
    const std::string prefix = base + "_v";
    if (stem.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::string::size_type pos = prefix.size();
    auto major = parse_number(stem, pos);
    if (!major || pos >= stem.size() || stem[pos] != '.') {
        return std::nullopt;
    }
    pos++;
    auto minor = parse_number(stem, pos);
    if (!minor) {
        return std::nullopt;
    }
    return Version{*major, *minor};
}

}  // namespace

std::string
sturdy::next_version_suffix(const std::string& path) {
    const fs::path file_path(path);
    const std::string base = file_path.stem().string();
    const fs::path dir = file_path.has_parent_path() ? file_path.parent_path() : fs::path(".");

    std::optional<Version> highest;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return "_v0.0";
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return "_v0.0";
        }
        auto version = parse_version(it->path().stem().string(), base);
        if (version && (!highest || *version > *highest)) {
            highest = version;
        }
    }
    if (ec) {
        return "_v0.0";
    }

    if (!highest) {
        return "_v0.0";
    }

    Version next{highest->major, highest->minor + 1};
    if (next.minor >= 10) {
        next.major += 1;
        next.minor = 0;
    }
    return fmt::format("_v{}.{}", next.major, next.minor);
}

std::string
sturdy::versioned_output_path(const std::string& path, const std::string& suffix) {
    const fs::path file_path(path);

    std::string decorated = suffix;
    if (!decorated.empty() && decorated[0] != '_') {
        decorated = "_" + decorated;
    }

    auto name = file_path.stem().string() + decorated + file_path.extension().string();
    return (file_path.parent_path() / name).string();
}

std::string
sturdy::default_output_path(const std::string& output_dir, const std::string& file_name) {
    return (fs::path(output_dir) / file_name).string();
}
