#pragma once

#include <string>
#include <vector>

namespace tempest {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim_copy(const std::string& s);

// Splits on a single delimiter character. Empty fields are preserved,
// so "a,,b" yields {"a", "", "b"}.
std::vector<std::string> split(const std::string& s, char delim);

// Escapes a string for safe inclusion in a CSV cell.
//
// If the string contains a comma, quote, or newline, the result will be wrapped
// in double-quotes and any internal quotes will be doubled.
std::string csv_escape(const std::string& s);

// Formats a double with enough digits to round-trip ("%.17g" trimmed).
std::string format_double(double v);

} // namespace tempest
