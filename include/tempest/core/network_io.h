#pragma once

#include <string>

#include "tempest/core/network.h"

namespace tempest {

// Parses a biadjacency matrix: comma-separated reals, one row per plant, no
// header. Throws FormatError for an empty document, a non-numeric cell, or rows
// of different lengths.
Matrix parse_matrix_csv(const std::string& text);

// Reads and parses a CSV matrix file. I/O failures throw std::runtime_error.
Matrix load_matrix_csv(const std::string& path);

// Inverse of parse_matrix_csv.
std::string matrix_to_csv(const Matrix& m);

} // namespace tempest
