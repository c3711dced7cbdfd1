
#include "worker_pool.hpp"
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

namespace salvage {

void parallel_for(size_t count, size_t width, const CancelToken &cancel,
                  const std::function<void(size_t)> &fn) {
  if (count == 0)
    return;
  width = std::max<size_t>(1, std::min(width, count));
  std::atomic<size_t> next{0};
  auto worker = [&]() {
    for (;;) {
      if (cancel.cancelled())
        return;
      size_t i = next.fetch_add(1);
      if (i >= count)
        return;
      fn(i);
    }
  };
  if (width == 1) {
    worker();
    return;
  }
  std::vector<std::thread> th;
  th.reserve(width);
  for (size_t i = 0; i < width; i++)
    th.emplace_back(worker);
  for (auto &t : th)
    t.join();
}

} // namespace salvage
