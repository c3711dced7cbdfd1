#pragma once
#include <cstddef>
#include <functional>
#include "util.hpp"

namespace salvage {

// Runs fn(i) for i in [0, count) on at most width threads. Items not yet
// started when cancel fires are skipped. Returns after every started item
// has finished.
void parallel_for(size_t count, size_t width, const CancelToken& cancel,
                  const std::function<void(size_t)>& fn);

} // namespace salvage
