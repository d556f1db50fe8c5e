#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace cwsens {

/// Table of samples, one row per sample and one column per dimension,
/// read from a CSV file with a single header row.
class SampleTable {
public:
  SampleTable() = default;

  /// Load a CSV (comma or whitespace separated) with a single header row;
  /// comments (#) and empty lines are ignored. Rows with a different number
  /// of columns than the first data row throw DimensionMismatch, unparseable
  /// rows throw std::runtime_error.
  /// Returns false if the file cannot be opened or holds no data.
  bool LoadCSV(const std::string& path);

  const std::vector<std::vector<double>>& rows() const noexcept { return rows_; }
  const std::vector<std::string>& header() const noexcept { return header_; }
  std::size_t n_rows() const noexcept { return rows_.size(); }
  std::size_t n_cols() const noexcept { return rows_.empty() ? 0 : rows_.front().size(); }

  /// Single column as a vector
  std::vector<double> column(std::size_t c) const;

private:
  std::vector<std::string>         header_;
  std::vector<std::vector<double>> rows_;
};

} // namespace cwsens
