#pragma once

#include <stdexcept>
#include <string>

namespace tempest {

// No usable network, inconsistent dimensions, or out-of-range settings.
// Fatal to matrix construction / engine creation.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed external input (CSV networks, scenario JSON). Raised at parse time,
// before any engine state is touched.
class FormatError : public std::runtime_error {
 public:
  explicit FormatError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace tempest
