#include "transfer_error.hpp"

#include <array>
#include <utility>

namespace {

struct CodeName {
  TransferErrorCode code;
  const char* name;
};

constexpr std::array<CodeName, 12> kCodeNames = {{
  {TransferErrorCode::SourceNotFound, "not_found"},
  {TransferErrorCode::DestinationExists, "exists"},
  {TransferErrorCode::DestinationFolderMissing, "folder_missing"},
  {TransferErrorCode::Locked, "locked"},
  {TransferErrorCode::LockTimeout, "lock_timeout"},
  {TransferErrorCode::TruncatedSource, "truncated"},
  {TransferErrorCode::ChannelFault, "channel"},
  {TransferErrorCode::PartialTreeFailure, "partial_tree"},
  {TransferErrorCode::IoError, "io"},
  {TransferErrorCode::ProtocolError, "protocol"},
  {TransferErrorCode::InvalidRequest, "invalid_request"},
  {TransferErrorCode::Cancelled, "cancelled"},
}};

std::string describe_partial(const std::vector<FailedJob>& failed, std::size_t total) {
  std::string message = std::to_string(failed.size()) + " of " + std::to_string(total) +
                        " entries failed";
  if(!failed.empty()) {
    message += "; first: " + failed.front().job.source_file.string() + ": " +
               failed.front().message;
  }
  return message;
}

} // namespace

const char* error_code_name(TransferErrorCode code) {
  for(const auto& entry : kCodeNames) {
    if(entry.code == code) return entry.name;
  }
  return "io";
}

std::optional<TransferErrorCode> error_code_from_name(const std::string& name) {
  for(const auto& entry : kCodeNames) {
    if(name == entry.name) return entry.code;
  }
  return std::nullopt;
}

TransferError::TransferError(TransferErrorCode code, const std::string& message,
                             std::filesystem::path path)
  : std::runtime_error(message), code_(code), path_(std::move(path)) {}

PartialTreeFailure::PartialTreeFailure(std::vector<FailedJob> failed_jobs,
                                       std::size_t total_jobs,
                                       TransferSummary summary)
  : TransferError(TransferErrorCode::PartialTreeFailure,
                  describe_partial(failed_jobs, total_jobs)),
    failed_jobs_(std::move(failed_jobs)),
    total_jobs_(total_jobs),
    summary_(summary) {}

AbortedTransfer::AbortedTransfer(const TransferError& cause,
                                 TransferSummary completed,
                                 std::vector<FailedJob> failed_jobs)
  : TransferError(cause.code(),
                  std::string("transfer aborted after ") + std::to_string(completed.files_copied) +
                  " files: " + cause.what(),
                  cause.path()),
    completed_(completed),
    failed_jobs_(std::move(failed_jobs)) {}
