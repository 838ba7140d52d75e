#include "retry_policy.hpp"

#include <algorithm>

LockRetryPolicy::LockRetryPolicy(std::size_t max_tries,
                                 std::chrono::milliseconds retry_delay,
                                 Logger* logger)
  : max_tries_(std::max<std::size_t>(1, max_tries)),
    retry_delay_(std::max(retry_delay, std::chrono::milliseconds(0))),
    logger_(logger) {}

std::unique_ptr<WriteSink> LockRetryPolicy::open_for_write(FileSystem& fs,
                                                           const std::filesystem::path& destination,
                                                           WriteMode mode,
                                                           bool overwrite) const {
  return run(destination, [&]() {
    return fs.open_for_write(destination, mode, overwrite);
  });
}
