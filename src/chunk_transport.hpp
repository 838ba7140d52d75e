#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>

#include "file_system.hpp"
#include "log.hpp"
#include "retry_policy.hpp"

struct TransferProgress {
  std::filesystem::path source_file;
  std::filesystem::path destination_file;
  uint64_t bytes_transferred = 0;
  uint64_t total_bytes = 0;
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

// Set from any thread; checked between buffers and between files.
class CancelToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> cancelled_{false};
};

struct ChunkTransportOptions {
  std::size_t buffer_size_bytes = 4 * 1024 * 1024;
  bool overwrite = false;
  LockRetryPolicy retry;
  ProgressCallback progress;
  const CancelToken* cancel = nullptr;
  Logger* logger = nullptr;
};

// Copies one regular file buffer by buffer, in order. Buffer N is applied at
// the destination before buffer N+1 is read. The final buffer is sized to the
// remaining bytes. Returns the byte count written. A partial destination is
// left in place when the copy fails or is cancelled.
uint64_t transfer_file(FileSystem& source_fs,
                       const std::filesystem::path& source_file,
                       FileSystem& destination_fs,
                       const std::filesystem::path& destination_file,
                       const ChunkTransportOptions& options);
