#pragma once

#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <ios>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace ladder {

// Minimal CSV writer: comma separated, RFC 4180 style quoting where needed.
class CSVWriter {
public:
    // If fixedFloat is true, floating point values are written with fixed and the given precision.
    explicit CSVWriter(const std::string& filePath, bool fixedFloat = true, int precision = 6);
    ~CSVWriter();

    bool is_open() const { return ofs_.is_open(); }
    // False once any write (or the open itself) has failed.
    bool good() const { return static_cast<bool>(ofs_); }

    // Flush and close; returns false if anything written so far was lost.
    bool close();

    void header(const std::vector<std::string>& cols) { row(cols); }
    void header(std::initializer_list<std::string> cols) { row(std::vector<std::string>(cols)); }

    void row(const std::vector<std::string>& cells);

    template <typename... Ts>
    void row(const Ts&... values) {
        std::vector<std::string> cells;
        cells.reserve(sizeof...(Ts));
        (cells.emplace_back(to_string(values)), ...);
        row(cells);
    }

    template <typename... Ts>
    void header(const Ts&... names) {
        std::vector<std::string> cols;
        cols.reserve(sizeof...(Ts));
        (cols.emplace_back(std::string(names)), ...);
        row(cols);
    }

    static std::string escape_cell(std::string_view s);

private:
    std::ofstream ofs_{};
    bool fixedFloat_ = true;
    int precision_ = 6;

    static bool needs_quoting(std::string_view s);

    template <typename T>
    std::string to_string(const T& v) const {
        if constexpr (std::is_convertible_v<const T&, std::string_view>) {
            return std::string(std::string_view(v));
        } else if constexpr (std::is_floating_point_v<T>) {
            std::ostringstream oss;
            if (fixedFloat_) oss.setf(std::ios::fixed, std::ios::floatfield);
            oss << std::setprecision(precision_) << v;
            return std::move(oss).str();
        } else {
            std::ostringstream oss;
            oss << v;
            return std::move(oss).str();
        }
    }
};

// Reader for files produced by CSVWriter (and plain hand-written CSV).
// Quoted cells may contain commas and doubled quotes; embedded newlines are not supported.
class CSVReader {
public:
    explicit CSVReader(const std::string& filePath);
    explicit CSVReader(std::istream& in);

    bool is_open() const { return in_ != nullptr; }

    // Read the next non-empty row into cells. Returns false at end of input.
    // Throws std::runtime_error on an unterminated quote or a stream error.
    bool next(std::vector<std::string>& cells);

    // 1-based number of the line most recently returned by next().
    std::size_t line_number() const { return line_no_; }

    // Split one line into cells.
    static std::vector<std::string> split(std::string_view line);

private:
    std::ifstream file_{};
    std::istream* in_ = nullptr;
    std::size_t line_no_ = 0;
};

} // namespace ladder
