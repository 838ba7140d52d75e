#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <thread>
#include <utility>

#include "file_system.hpp"
#include "log.hpp"

// Bounded, fixed-delay retry around destination opens. Only the Locked fault
// class is retried; anything else propagates on the first attempt.
class LockRetryPolicy {
public:
  static constexpr std::size_t kDefaultMaxTries = 100;
  static constexpr std::chrono::milliseconds kDefaultRetryDelay{10};

  LockRetryPolicy() = default;
  explicit LockRetryPolicy(std::size_t max_tries,
                           std::chrono::milliseconds retry_delay = kDefaultRetryDelay,
                           Logger* logger = nullptr);

  std::size_t max_tries() const { return max_tries_; }
  std::chrono::milliseconds retry_delay() const { return retry_delay_; }

  std::unique_ptr<WriteSink> open_for_write(FileSystem& fs,
                                            const std::filesystem::path& destination,
                                            WriteMode mode,
                                            bool overwrite) const;

  // Runs `attempt` until it returns without a Locked fault. Each Locked fault
  // before the max_tries-th costs one retry_delay; the max_tries-th ends in
  // LockTimeout at once.
  template<typename Attempt>
  auto run(const std::filesystem::path& destination, Attempt&& attempt) const -> decltype(attempt()) {
    for(std::size_t tries = 1;; ++tries) {
      try {
        return attempt();
      } catch(const TransferError& e) {
        if(e.code() != TransferErrorCode::Locked) throw;
        if(tries >= max_tries_) {
          throw TransferError(TransferErrorCode::LockTimeout,
                              "gave up after " + std::to_string(tries) + " tries: " + e.what(),
                              destination);
        }
        log_debug(logger_, "{} locked (try {}/{}), waiting {}ms",
                  destination.string(), tries, max_tries_, retry_delay_.count());
        std::this_thread::sleep_for(retry_delay_);
      }
    }
  }

private:
  std::size_t max_tries_ = kDefaultMaxTries;
  std::chrono::milliseconds retry_delay_ = kDefaultRetryDelay;
  Logger* logger_ = nullptr;
};
