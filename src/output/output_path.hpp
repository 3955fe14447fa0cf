#pragma once

/*
    Naming of patched output files.

    With versioning enabled a patched `src/foo.cpp` is written next to the
    original as `src/foo_v<major>.<minor>.cpp`, picking the version after the
    highest one already present in that directory.
*/

#include <string>

namespace sturdy {

// "_v0.0" when no versioned sibling exists, otherwise the next version.
// The minor number rolls over into the major number at 10.
std::string
next_version_suffix(const std::string& path);

std::string
versioned_output_path(const std::string& path, const std::string& suffix);

std::string
default_output_path(const std::string& output_dir, const std::string& file_name);

}  // namespace sturdy
