#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

enum class TransferErrorCode {
  SourceNotFound,
  DestinationExists,
  DestinationFolderMissing,
  Locked,          // sharing violation on a destination open; retryable
  LockTimeout,
  TruncatedSource,
  ChannelFault,    // the channel itself failed; aborts the remaining queue
  PartialTreeFailure,
  IoError,
  ProtocolError,
  InvalidRequest,
  Cancelled
};

// Stable snake_case names, also used as the "fault" field on the wire.
const char* error_code_name(TransferErrorCode code);
std::optional<TransferErrorCode> error_code_from_name(const std::string& name);

class TransferError : public std::runtime_error {
public:
  TransferError(TransferErrorCode code, const std::string& message,
                std::filesystem::path path = {});

  TransferErrorCode code() const noexcept { return code_; }
  const std::filesystem::path& path() const noexcept { return path_; }

  // ChannelFault is the only class that stops a tree copy early.
  bool is_fatal() const noexcept { return code_ == TransferErrorCode::ChannelFault; }

private:
  TransferErrorCode code_;
  std::filesystem::path path_;
};

struct TransferJob {
  std::filesystem::path source_file;
  std::filesystem::path destination_file;
};

struct TransferSummary {
  std::size_t files_copied = 0;
  uint64_t bytes_copied = 0;
  std::size_t directories_created = 0;
};

struct FailedJob {
  TransferJob job;
  TransferErrorCode code = TransferErrorCode::IoError;
  std::string message;
};

// Raised at the end of a tree copy when some entries failed and the rest
// completed. total_jobs() counts files, sub-directories and entries the
// planner could not read, so failed_jobs().size() never exceeds it.
class PartialTreeFailure : public TransferError {
public:
  PartialTreeFailure(std::vector<FailedJob> failed_jobs,
                     std::size_t total_jobs,
                     TransferSummary summary);

  const std::vector<FailedJob>& failed_jobs() const noexcept { return failed_jobs_; }
  std::size_t total_jobs() const noexcept { return total_jobs_; }
  const TransferSummary& summary() const noexcept { return summary_; }

private:
  std::vector<FailedJob> failed_jobs_;
  std::size_t total_jobs_ = 0;
  TransferSummary summary_;
};

// A tree copy aborted by a ChannelFault; keeps what finished before the abort.
class AbortedTransfer : public TransferError {
public:
  AbortedTransfer(const TransferError& cause,
                  TransferSummary completed,
                  std::vector<FailedJob> failed_jobs);

  const TransferSummary& completed() const noexcept { return completed_; }
  const std::vector<FailedJob>& failed_jobs() const noexcept { return failed_jobs_; }

private:
  TransferSummary completed_;
  std::vector<FailedJob> failed_jobs_;
};
