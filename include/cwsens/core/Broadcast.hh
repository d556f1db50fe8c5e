#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace cwsens {

/// Common row count of a set of named per-row inputs: every input must have
/// either length 1 or the same length n > 1. Empty inputs are ignored.
/// Throws DimensionMismatch otherwise.
std::size_t BroadcastLength(const std::vector<std::pair<std::string, std::size_t>>& lengths,
                            const std::string& where);

/// Expand a length-1 vector to n entries; a length-n vector is returned as is.
std::vector<double> Broadcast(const std::vector<double>& v, std::size_t n,
                              const std::string& name, const std::string& where);

} // namespace cwsens
