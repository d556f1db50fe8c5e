#include "cwsens/io/SampleTable.hh"
#include "cwsens/core/Errors.hh"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace cwsens {

namespace {
inline bool is_comment_or_empty(const std::string& s) {
  for (char c : s) { if (c == '#') return true; if (!std::isspace(static_cast<unsigned char>(c))) return false; }
  return true;
}

inline void trim(std::string& s) {
  size_t i = 0; while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  size_t j = s.size(); while (j > i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
  s = s.substr(i, j - i);
}

// Split on commas if there are any, otherwise on whitespace.
std::vector<std::string> split_fields(const std::string& line) {
  std::vector<std::string> out;
  std::stringstream ss(line);
  std::string f;
  if (line.find(',') != std::string::npos) {
    while (std::getline(ss, f, ',')) { trim(f); out.push_back(f); }
  } else {
    while (ss >> f) out.push_back(f);
  }
  return out;
}

inline bool parse_double(const std::string& s, double& x) {
  if (s.empty()) return false;
  char* end = nullptr;
  x = std::strtod(s.c_str(), &end);
  return end == s.c_str() + s.size();
}
} // namespace

bool SampleTable::LoadCSV(const std::string& path) {
  header_.clear(); rows_.clear();

  std::ifstream in(path);
  if (!in) return false;

  std::string line;
  bool saw_header = false;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    if (line.empty() || is_comment_or_empty(line)) continue;
    const auto fields = split_fields(line);
    if (!saw_header) { saw_header = true; header_ = fields; continue; } // skip header row

    std::vector<double> row(fields.size());
    for (std::size_t c = 0; c < fields.size(); ++c) {
      if (!parse_double(fields[c], row[c])) {
        throw std::runtime_error(path + ":" + std::to_string(lineno) +
                                 ": cannot parse '" + fields[c] + "' as a number");
      }
    }
    if (!rows_.empty() && row.size() != rows_.front().size()) {
      throw DimensionMismatch(path + ":" + std::to_string(lineno) + ": expected " +
                              std::to_string(rows_.front().size()) + " columns, got " +
                              std::to_string(row.size()));
    }
    rows_.push_back(std::move(row));
  }
  return !rows_.empty();
}

std::vector<double> SampleTable::column(std::size_t c) const {
  if (c >= n_cols())
    throw std::out_of_range("SampleTable::column: index " + std::to_string(c) + " out of range");
  std::vector<double> out;
  out.reserve(rows_.size());
  for (const auto& r : rows_) out.push_back(r[c]);
  return out;
}

} // namespace cwsens
