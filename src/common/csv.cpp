#include "ladder/csv.hpp"

#include <stdexcept>

namespace ladder {

CSVWriter::CSVWriter(const std::string& filePath, bool fixedFloat, int precision)
    : fixedFloat_(fixedFloat), precision_(precision) {
    ofs_.open(filePath, std::ios::out | std::ios::trunc);
    if (ofs_) {
        if (fixedFloat_) ofs_.setf(std::ios::fixed, std::ios::floatfield);
        ofs_ << std::setprecision(precision_);
    }
}

CSVWriter::~CSVWriter() { if (ofs_.is_open()) ofs_.flush(); }

bool CSVWriter::close() {
    if (!ofs_.is_open()) return false;
    ofs_.flush();
    const bool ok = static_cast<bool>(ofs_);
    ofs_.close();
    return ok && !ofs_.fail();
}

bool CSVWriter::needs_quoting(std::string_view s) {
    for (char c : s) {
        if (c == ',' || c == '"' || c == '\n' || c == '\r') return true;
    }
    if (!s.empty() && (s.front() == ' ' || s.back() == ' ')) return true;
    return false;
}

std::string CSVWriter::escape_cell(std::string_view s) {
    if (!needs_quoting(s)) return std::string(s);
    std::string out; out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void CSVWriter::row(const std::vector<std::string>& cells) {
    if (!ofs_) return;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i) ofs_ << ',';
        ofs_ << escape_cell(cells[i]);
    }
    ofs_ << '\n';
}

// ---------------- CSVReader ----------------

CSVReader::CSVReader(const std::string& filePath) {
    file_.open(filePath);
    if (file_.is_open()) in_ = &file_;
}

CSVReader::CSVReader(std::istream& in) : in_(&in) {}

std::vector<std::string> CSVReader::split(std::string_view line) {
    std::vector<std::string> cells;
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') { cur.push_back('"'); ++i; }
                else quoted = false;
            } else {
                cur.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (quoted) throw std::runtime_error("unterminated quoted cell");
    cells.push_back(std::move(cur));
    return cells;
}

bool CSVReader::next(std::vector<std::string>& cells) {
    if (!in_) return false;
    std::string line;
    while (std::getline(*in_, line)) {
        ++line_no_;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        try {
            cells = split(line);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("line " + std::to_string(line_no_) + ": " + e.what());
        }
        return true;
    }
    if (in_->bad()) throw std::runtime_error("read error after line " + std::to_string(line_no_));
    return false;
}

} // namespace ladder
