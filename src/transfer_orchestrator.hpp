#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "chunk_transport.hpp"
#include "file_system.hpp"
#include "log.hpp"
#include "tree_planner.hpp"

enum class TransferDirection {
  Push,  // local -> remote
  Pull   // remote -> local
};

const char* direction_name(TransferDirection direction);

struct TransferRequest {
  std::filesystem::path source_path;
  std::filesystem::path destination_path;
  TransferDirection direction = TransferDirection::Push;
  std::size_t buffer_size_bytes = 4 * 1024 * 1024;
  bool overwrite = false;
  bool force_create_parents = false;
};

enum class TransferState { Idle, Validating, Planning, Materializing, Copying, Done, Failed };

const char* transfer_state_name(TransferState state);

struct OrchestratorOptions {
  LockRetryPolicy retry;
  ProgressCallback progress;
  const CancelToken* cancel = nullptr;
};

// Runs one copy request. Files are processed strictly one after another.
class TransferOrchestrator {
public:
  TransferOrchestrator(FileSystem& local_fs,
                       FileSystem& remote_fs,
                       OrchestratorOptions options = {},
                       std::shared_ptr<Logger> logger = nullptr);

  // Single file: errors propagate as they are.
  // Tree: per-file errors are collected and raised together as
  // PartialTreeFailure at the end; a ChannelFault or cancellation stops the
  // queue and raises AbortedTransfer.
  TransferSummary copy(const TransferRequest& request);

  TransferState state() const { return state_; }
  const std::vector<PlanIssue>& plan_issues() const { return plan_issues_; }

private:
  struct Target {
    std::filesystem::path source;       // absolute, on the source side
    std::filesystem::path destination;  // absolute, on the destination side
    bool source_is_directory = false;
  };

  Target validate(const TransferRequest& request, FileSystem& source_fs, FileSystem& destination_fs);
  TransferSummary copy_single(const TransferRequest& request, const Target& target,
                              FileSystem& source_fs, FileSystem& destination_fs);
  TransferSummary copy_tree(const TransferRequest& request, const Target& target,
                            FileSystem& source_fs, FileSystem& destination_fs);
  ChunkTransportOptions transport_options(const TransferRequest& request) const;
  void enter(TransferState state);

  FileSystem& local_fs_;
  FileSystem& remote_fs_;
  OrchestratorOptions options_;
  std::shared_ptr<Logger> logger_;
  TransferState state_ = TransferState::Idle;
  std::vector<PlanIssue> plan_issues_;
};
