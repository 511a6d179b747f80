#include "tempest/core/network_io.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>
#include <vector>

#include "tempest/core/errors.h"
#include "tempest/util/file_io.h"
#include "tempest/util/strings.h"

namespace tempest {
namespace {

bool parse_cell(const std::string& raw, double& out) {
  const std::string cell = trim_copy(raw);
  if (cell.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(cell.c_str(), &end);
  if (end != cell.c_str() + cell.size() || errno == ERANGE || std::isnan(v)) return false;
  out = v;
  return true;
}

} // namespace

Matrix parse_matrix_csv(const std::string& text) {
  const std::string body = trim_copy(text);
  if (body.empty()) throw FormatError("Empty CSV file");

  Matrix m;
  std::size_t row_no = 0;
  for (std::string line : split(body, '\n')) {
    ++row_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::vector<double> row;
    std::size_t col_no = 0;
    for (const std::string& cell : split(line, ',')) {
      ++col_no;
      double v = 0.0;
      if (!parse_cell(cell, v)) {
        throw FormatError("Invalid CSV format: contains non-numeric values (row " + std::to_string(row_no) +
                          ", column " + std::to_string(col_no) + ")");
      }
      row.push_back(v);
    }

    if (!m.empty() && row.size() != m.front().size()) {
      throw FormatError("Invalid CSV format: rows have different lengths (row " + std::to_string(row_no) + ")");
    }
    m.push_back(std::move(row));
  }
  return m;
}

Matrix load_matrix_csv(const std::string& path) {
  try {
    return parse_matrix_csv(read_text_file(path));
  } catch (const FormatError& e) {
    throw FormatError(path + ": " + e.what());
  }
}

std::string matrix_to_csv(const Matrix& m) {
  std::string out;
  for (const auto& row : m) {
    for (std::size_t j = 0; j < row.size(); ++j) {
      if (j > 0) out.push_back(',');
      out += format_double(row[j]);
    }
    out.push_back('\n');
  }
  return out;
}

} // namespace tempest
