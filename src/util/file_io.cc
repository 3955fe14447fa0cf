#include "file_io.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

bool
read_stream(FILE* stream, std::string& contents) {
    char chunk[4096];
    size_t n = 0;
    while ((n = fread(chunk, 1, sizeof(chunk), stream)) > 0) {
        contents.append(chunk, n);
    }
    return ferror(stream) == 0;
}

}  // namespace

sturdy::FileStatus
sturdy::check_file_status(const std::string& path) {
    if (path.empty() || path == "/dev/null" || path == "nul") {
        return FileStatus::kNullPath;
    }

    fs::path file_path(path);

    std::error_code ec;
    if (!fs::exists(file_path, ec)) {
        return FileStatus::kFileDoesNotExist;
    }

    if (!(fs::is_regular_file(file_path, ec) || fs::is_fifo(file_path, ec) || fs::is_symlink(file_path, ec))) {
        return FileStatus::kFileNotReadable;
    }

    auto perms = fs::status(file_path, ec).permissions();
    if (((perms & fs::perms::owner_read) == fs::perms::none) &&
        ((perms & fs::perms::group_read) == fs::perms::none)) {
        return FileStatus::kNoPermission;
    }

    return FileStatus::kOk;
}

std::string
sturdy::to_string(const FileStatus error_code) {
    switch (error_code) {
        case FileStatus::kOk:
            return "Success";
        case FileStatus::kFileDoesNotExist:
            return "File does not exist";
        case FileStatus::kFileNotReadable:
            return "File is not readable (invalid file)";
        case FileStatus::kNoPermission:
            return "File is not readable (no permission)";
        case FileStatus::kNullPath:
            return "Null path";
        default:
            return "Unknown error";
    }
}

bool
sturdy::read_file(const std::string& path, std::string& contents) {
    contents.clear();

    FILE* stream = fopen(path.c_str(), "rb");
    if (!stream) {
        fmt::print(stderr, "Failed to open file '{}': {}\n", path, strerror(errno));
        return false;
    }

    bool ok = read_stream(stream, contents);
    fclose(stream);
    if (!ok) {
        fmt::print(stderr, "Failed to read file '{}'\n", path);
    }
    return ok;
}

bool
sturdy::read_stdin(std::string& contents) {
    contents.clear();
    return read_stream(stdin, contents);
}

bool
sturdy::write_file(const std::string& path, const std::string& contents) {
    fs::path file_path(path);
    if (file_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(file_path.parent_path(), ec);
        if (ec) {
            fmt::print(stderr, "Failed to create directory '{}': {}\n", file_path.parent_path().string(),
                       ec.message());
            return false;
        }
    }

    FILE* f = fopen(path.c_str(), "wb");
    if (!f) {
        fmt::print(stderr, "Failed to open '{}' for writing.\n", path);
        fmt::print(stderr, "   errno ({}) = {}\n", errno, strerror(errno));
        return false;
    }

    bool ok = fwrite(contents.data(), 1, contents.size(), f) == contents.size();
    if (fclose(f) != 0) {
        ok = false;
    }
    if (!ok) {
        fmt::print(stderr, "Failed to write '{}'\n", path);
    }
    return ok;
}
