#include "parser_table.h"

#include <Eigen/Dense>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <locale>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dv {

namespace detail {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

struct Line {
    std::size_t number = 0;
    std::vector<std::string> cells;
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trim(const std::string& s) {
    std::size_t a = 0;
    std::size_t b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) {
        ++a;
    }
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) {
        --b;
    }
    return s.substr(a, b - a);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::vector<std::string> split_cells(const std::string& line, Delimiter delimiter) {
    std::vector<std::string> cells;
    if (delimiter == Delimiter::Whitespace) {
        std::istringstream iss(line);
        std::string tok;
        while (iss >> tok) {
            cells.push_back(unquote(tok));
        }
        return cells;
    }

    std::string cell;
    bool quoted = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
            cell.push_back(c);
        } else if (c == ',' && !quoted) {
            cells.push_back(unquote(trim(cell)));
            cell.clear();
        } else {
            cell.push_back(c);
        }
    }
    cells.push_back(unquote(trim(cell)));
    return cells;
}

std::vector<Line> read_lines(std::istream& in, Delimiter delimiter) {
    std::vector<Line> lines;
    std::string physical_line;
    std::size_t physical_line_number = 0;
    while (std::getline(in, physical_line)) {
        ++physical_line_number;
        if (physical_line_number == 1 && physical_line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            physical_line.erase(0, 3);
        }
        if (!physical_line.empty() && physical_line.back() == '\r') {
            physical_line.pop_back();
        }
        if (trim(physical_line).empty()) {
            continue;
        }
        lines.push_back({physical_line_number, split_cells(physical_line, delimiter)});
    }
    return lines;
}

// Whole-cell numeric conversion in the classic locale; empty, partially
// numeric or hexadecimal text yields false. "nan" and "inf" are accepted.
bool to_number(const std::string& text, double& value) {
    const std::string s = trim(text);
    if (s.empty()) {
        return false;
    }

    const std::string lower = to_lower(s);
    const bool negative = lower.front() == '-';
    const std::string unsigned_text = (negative || lower.front() == '+') ? lower.substr(1) : lower;
    if (unsigned_text == "nan") {
        value = kNaN;
        return true;
    }
    if (unsigned_text == "inf" || unsigned_text == "infinity") {
        value = negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
        return true;
    }

    std::istringstream iss(s);
    iss.imbue(std::locale::classic());
    double parsed = 0.0;
    iss >> parsed;
    if (iss.fail() || !iss.eof()) {
        return false;
    }
    value = parsed;
    return true;
}

double coerce(const std::string& text, bool& coerced) {
    double value = 0.0;
    if (to_number(text, value)) {
        return value;
    }
    coerced = true;
    return kNaN;
}

std::string read_all(const std::string& path, const char* kind) {
    std::ifstream fin(path);
    if (!fin) {
        throw std::runtime_error(std::string("Failed to open ") + kind + " file: " + path);
    }
    std::ostringstream oss;
    oss << fin.rdbuf();
    return oss.str();
}

std::vector<std::string> unique_names(const std::vector<std::string>& raw) {
    std::vector<std::string> names;
    std::set<std::string> seen;
    names.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        std::string base = raw[i].empty() ? "Unnamed: " + std::to_string(i) : raw[i];
        std::string name = base;
        for (int suffix = 1; seen.count(name) != 0; ++suffix) {
            name = base + "." + std::to_string(suffix);
        }
        seen.insert(name);
        names.push_back(name);
    }
    return names;
}

} // namespace detail

std::optional<Delimiter> matrix_delimiter_for_path(const std::string& path) {
    const std::string lower = detail::to_lower(path);
    if (detail::ends_with(lower, ".csv")) {
        return Delimiter::Comma;
    }
    if (detail::ends_with(lower, ".txt")) {
        return Delimiter::Whitespace;
    }
    return std::nullopt;
}

Delimiter table_delimiter_for_path(const std::string& path) {
    return detail::ends_with(detail::to_lower(path), ".csv") ? Delimiter::Comma : Delimiter::Whitespace;
}

MatrixData parse_matrix_stream(std::istream& in, Delimiter delimiter, const std::string& source_name) {
    using namespace detail;

    const std::vector<Line> lines = read_lines(in, delimiter);
    if (lines.empty()) {
        throw std::runtime_error("No header row found in: " + source_name);
    }

    const std::vector<std::string>& header = lines.front().cells;
    if (header.size() < 2) {
        throw std::runtime_error("Header row of " + source_name + " has no value columns");
    }

    const Eigen::Index col_count = static_cast<Eigen::Index>(header.size() - 1);
    const Eigen::Index row_count = static_cast<Eigen::Index>(lines.size() - 1);
    if (row_count == 0) {
        throw std::runtime_error("No data rows found in: " + source_name);
    }

    MatrixData out;
    out.xCoords.resize(col_count);
    out.yCoords.resize(row_count);
    out.values.resize(row_count, col_count);

    for (Eigen::Index col = 0; col < col_count; ++col) {
        out.xCoords[col] = coerce(header[static_cast<std::size_t>(col) + 1], out.coordinatesCoerced);
    }

    for (Eigen::Index row = 0; row < row_count; ++row) {
        const Line& line = lines[static_cast<std::size_t>(row) + 1];
        if (line.cells.size() > header.size()) {
            throw std::runtime_error("Expected " + std::to_string(header.size()) + " fields in line " + std::to_string(line.number)
                                     + " of " + source_name + ", saw " + std::to_string(line.cells.size()));
        }

        out.yCoords[row] = coerce(line.cells.front(), out.coordinatesCoerced);
        for (Eigen::Index col = 0; col < col_count; ++col) {
            const std::size_t cell_index = static_cast<std::size_t>(col) + 1;
            if (cell_index >= line.cells.size() || trim(line.cells[cell_index]).empty()) {
                out.values(row, col) = kNaN;
                continue;
            }
            double value = 0.0;
            if (!to_number(line.cells[cell_index], value)) {
                throw std::runtime_error("Non-numeric value '" + line.cells[cell_index] + "' in line " + std::to_string(line.number)
                                         + " of " + source_name);
            }
            out.values(row, col) = value;
        }
    }

    return out;
}

MatrixData parse_matrix_positional_stream(std::istream& in, Delimiter delimiter, const std::string& source_name) {
    using namespace detail;

    const std::vector<Line> lines = read_lines(in, delimiter);
    if (lines.empty()) {
        throw std::runtime_error("No numeric data rows found in: " + source_name);
    }

    const std::size_t width = lines.front().cells.size();
    const Eigen::Index row_count = static_cast<Eigen::Index>(lines.size());
    const Eigen::Index col_count = static_cast<Eigen::Index>(width);

    MatrixData out;
    out.positionalFallback = true;
    out.values.resize(row_count, col_count);

    for (Eigen::Index row = 0; row < row_count; ++row) {
        const Line& line = lines[static_cast<std::size_t>(row)];
        if (line.cells.size() != width) {
            throw std::runtime_error("Row at line " + std::to_string(line.number) + " in " + source_name + " has "
                                     + std::to_string(line.cells.size()) + " fields, expected " + std::to_string(width));
        }
        for (Eigen::Index col = 0; col < col_count; ++col) {
            const std::string& cell = line.cells[static_cast<std::size_t>(col)];
            if (trim(cell).empty()) {
                out.values(row, col) = kNaN;
                continue;
            }
            double value = 0.0;
            if (!to_number(cell, value)) {
                throw std::runtime_error("Non-numeric value '" + cell + "' in line " + std::to_string(line.number) + " of " + source_name);
            }
            out.values(row, col) = value;
        }
    }

    out.yCoords = Eigen::ArrayXd::LinSpaced(row_count, 0.0, static_cast<double>(row_count - 1));
    out.xCoords = Eigen::ArrayXd::LinSpaced(col_count, 0.0, static_cast<double>(col_count - 1));
    return out;
}

MatrixData parse_matrix(const std::string& path) {
    const std::optional<Delimiter> delimiter = matrix_delimiter_for_path(path);
    if (!delimiter) {
        throw std::runtime_error("Unsupported matrix file type: " + path);
    }

    const std::string content = detail::read_all(path, "matrix");

    std::string named_failure;
    try {
        std::istringstream named(content);
        return parse_matrix_stream(named, *delimiter, path);
    } catch (const std::runtime_error& e) {
        named_failure = e.what();
    }

    std::istringstream positional(content);
    MatrixData out = parse_matrix_positional_stream(positional, *delimiter, path);
    out.fallbackReason = named_failure;
    return out;
}

TableData parse_table_stream(std::istream& in, Delimiter delimiter, bool has_header, const std::string& source_name) {
    using namespace detail;

    const std::vector<Line> lines = read_lines(in, delimiter);
    if (lines.empty()) {
        throw std::runtime_error("No columns to parse from: " + source_name);
    }

    TableData out;
    out.headerless = !has_header;

    std::size_t width = 0;
    std::size_t first_data_line = 0;
    if (has_header) {
        out.columnNames = unique_names(lines.front().cells);
        width = out.columnNames.size();
        first_data_line = 1;
    } else {
        for (const Line& line : lines) {
            width = std::max(width, line.cells.size());
        }
        for (std::size_t col = 0; col < width; ++col) {
            out.columnNames.push_back(std::to_string(col));
        }
    }

    const Eigen::Index row_count = static_cast<Eigen::Index>(lines.size() - first_data_line);
    const Eigen::Index col_count = static_cast<Eigen::Index>(width);
    out.values = Eigen::ArrayXXd::Constant(row_count, col_count, kNaN);

    for (Eigen::Index row = 0; row < row_count; ++row) {
        const Line& line = lines[first_data_line + static_cast<std::size_t>(row)];
        if (line.cells.size() > width) {
            throw std::runtime_error("Expected " + std::to_string(width) + " fields in line " + std::to_string(line.number)
                                     + " of " + source_name + ", saw " + std::to_string(line.cells.size()));
        }
        for (std::size_t col = 0; col < line.cells.size(); ++col) {
            double value = 0.0;
            if (to_number(line.cells[col], value)) {
                out.values(row, static_cast<Eigen::Index>(col)) = value;
            }
        }
    }

    return out;
}

TableData parse_table(const std::string& path) {
    const Delimiter delimiter = table_delimiter_for_path(path);
    const std::string content = detail::read_all(path, "table");

    try {
        std::istringstream with_header(content);
        return parse_table_stream(with_header, delimiter, true, path);
    } catch (const std::runtime_error&) {
        std::istringstream headerless(content);
        return parse_table_stream(headerless, delimiter, false, path);
    }
}

} // namespace dv
