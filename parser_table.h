#pragma once

#include <Eigen/Dense>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace dv {

enum class Delimiter { Comma, Whitespace };

struct MatrixData {
    Eigen::ArrayXXd values;
    Eigen::ArrayXd xCoords;
    Eigen::ArrayXd yCoords;

    bool coordinatesCoerced = false;
    bool positionalFallback = false;
    std::string fallbackReason;

    Eigen::Index rowCount() const { return values.rows(); }
    Eigen::Index columnCount() const { return values.cols(); }
};

struct TableData {
    std::vector<std::string> columnNames;
    Eigen::ArrayXXd values; // NaN for missing or non-numeric cells
    bool headerless = false;

    Eigen::Index rowCount() const { return values.rows(); }
    Eigen::Index columnCount() const { return values.cols(); }
    bool empty() const { return values.rows() == 0 || values.cols() == 0; }
};

// Comma for .csv, whitespace for .txt, nullopt for anything else.
std::optional<Delimiter> matrix_delimiter_for_path(const std::string& path);

// Comma for .csv, whitespace otherwise.
Delimiter table_delimiter_for_path(const std::string& path);

MatrixData parse_matrix_stream(std::istream& in, Delimiter delimiter, const std::string& source_name = "<istream>");

MatrixData parse_matrix_positional_stream(std::istream& in, Delimiter delimiter, const std::string& source_name = "<istream>");

// Named coordinates first, positional indices if that layout cannot be read.
MatrixData parse_matrix(const std::string& path);

TableData parse_table_stream(std::istream& in, Delimiter delimiter, bool has_header, const std::string& source_name = "<istream>");

TableData parse_table(const std::string& path);

} // namespace dv
