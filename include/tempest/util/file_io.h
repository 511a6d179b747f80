#pragma once

#include <string>

namespace tempest {

// Reads entire file into a string. Throws std::runtime_error on failure.
//
// A relative path that does not exist under the working directory is also
// tried against the source tree (TEMPEST_SOURCE_DIR).
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
void write_text_file(const std::string& path, const std::string& contents);

// Directory part of a path ("" when the path has none).
std::string parent_dir(const std::string& path);

// Joins base_dir and a relative path. Absolute paths and an empty base are returned as-is.
std::string resolve_relative(const std::string& base_dir, const std::string& path);

} // namespace tempest
