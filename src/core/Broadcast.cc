#include "cwsens/core/Broadcast.hh"
#include "cwsens/core/Errors.hh"

namespace cwsens {

std::size_t BroadcastLength(const std::vector<std::pair<std::string, std::size_t>>& lengths,
                            const std::string& where) {
  std::size_t n = 1;
  for (const auto& [name, len] : lengths) {
    if (len == 0 || len == 1 || len == n) continue;
    if (n != 1) {
      throw DimensionMismatch(where + ": '" + name + "' has " + std::to_string(len) +
                              " rows, expected 1 or " + std::to_string(n));
    }
    n = len;
  }
  return n;
}

std::vector<double> Broadcast(const std::vector<double>& v, std::size_t n,
                              const std::string& name, const std::string& where) {
  if (v.size() == n) return v;
  if (v.size() == 1) return std::vector<double>(n, v.front());
  throw DimensionMismatch(where + ": '" + name + "' has " + std::to_string(v.size()) +
                          " rows, expected 1 or " + std::to_string(n));
}

} // namespace cwsens
