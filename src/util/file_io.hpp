#pragma once

#include <string>

namespace sturdy {

enum class FileStatus {
    kOk,
    kNullPath,
    kFileDoesNotExist,
    kFileNotReadable,
    kNoPermission,
};

FileStatus
check_file_status(const std::string& path);

std::string
to_string(FileStatus error_code);

// Read the whole file in binary mode; line endings are left untouched.
bool
read_file(const std::string& path, std::string& contents);

bool
read_stdin(std::string& contents);

// Write `contents` to `path`, creating missing parent directories.
bool
write_file(const std::string& path, const std::string& contents);

}  // namespace sturdy
