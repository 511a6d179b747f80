#include "tempest/util/file_io.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tempest {

namespace fs = std::filesystem;

namespace {

// Relative paths missing from the working directory are looked up in the
// source tree, so data/ and tests/data/ work from a build directory.
fs::path locate_input(const fs::path& requested) {
  std::error_code ec;
  if (requested.empty() || requested.is_absolute() || fs::exists(requested, ec)) return requested;
#ifdef TEMPEST_SOURCE_DIR
  const fs::path in_tree = fs::path(TEMPEST_SOURCE_DIR) / requested;
  if (fs::exists(in_tree, ec)) return in_tree;
#endif
  return requested;
}

} // namespace

std::string read_text_file(const std::string& path) {
  std::ifstream in(locate_input(path), std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec) throw std::runtime_error("Failed to create directory for " + path + " (" + ec.message() + ")");
  }

  std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("Failed to open file for writing: " + path);
  out << contents;
  out.flush();
  if (!out) throw std::runtime_error("Failed to write file: " + path);
}

std::string parent_dir(const std::string& path) { return fs::path(path).parent_path().string(); }

std::string resolve_relative(const std::string& base_dir, const std::string& path) {
  const fs::path p(path);
  if (base_dir.empty() || p.is_absolute()) return path;
  return (fs::path(base_dir) / p).string();
}

} // namespace tempest
