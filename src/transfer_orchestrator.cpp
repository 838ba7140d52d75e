#include "transfer_orchestrator.hpp"

#include <exception>
#include <string>
#include <utility>

namespace fs = std::filesystem;

const char* direction_name(TransferDirection direction) {
  return direction == TransferDirection::Push ? "push" : "pull";
}

const char* transfer_state_name(TransferState state) {
  switch(state) {
    case TransferState::Idle: return "idle";
    case TransferState::Validating: return "validating";
    case TransferState::Planning: return "planning";
    case TransferState::Materializing: return "materializing";
    case TransferState::Copying: return "copying";
    case TransferState::Done: return "done";
    case TransferState::Failed: return "failed";
  }
  return "idle";
}

TransferOrchestrator::TransferOrchestrator(FileSystem& local_fs,
                                           FileSystem& remote_fs,
                                           OrchestratorOptions options,
                                           std::shared_ptr<Logger> logger)
  : local_fs_(local_fs),
    remote_fs_(remote_fs),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer")) {}

void TransferOrchestrator::enter(TransferState state) {
  state_ = state;
  logger_->debug("state -> {}", transfer_state_name(state));
}

TransferSummary TransferOrchestrator::copy(const TransferRequest& request) {
  FileSystem& source_fs = request.direction == TransferDirection::Push ? local_fs_ : remote_fs_;
  FileSystem& destination_fs = request.direction == TransferDirection::Push ? remote_fs_ : local_fs_;
  plan_issues_.clear();

  try {
    enter(TransferState::Validating);
    if(request.buffer_size_bytes == 0) {
      throw TransferError(TransferErrorCode::InvalidRequest, "buffer size must be > 0");
    }
    // one buffer is one write, so it must fit what the destination accepts per write
    auto write_limit = destination_fs.max_write_size();
    if(write_limit && request.buffer_size_bytes > *write_limit) {
      throw TransferError(TransferErrorCode::InvalidRequest,
                          "buffer size " + std::to_string(request.buffer_size_bytes) +
                          " exceeds the " + std::to_string(*write_limit) + " byte write limit of " +
                          destination_fs.describe());
    }
    auto target = validate(request, source_fs, destination_fs);
    logger_->info("{} {} {} -> {} {}", direction_name(request.direction),
                  source_fs.describe(), target.source.string(),
                  destination_fs.describe(), target.destination.string());
    TransferSummary summary = target.source_is_directory
      ? copy_tree(request, target, source_fs, destination_fs)
      : copy_single(request, target, source_fs, destination_fs);
    enter(TransferState::Done);
    return summary;
  } catch(const TransferError&) {
    enter(TransferState::Failed);
    throw;
  } catch(const std::exception& e) {
    enter(TransferState::Failed);
    logger_->error("{} failed: {}", direction_name(request.direction), e.what());
    throw;
  }
}

TransferOrchestrator::Target TransferOrchestrator::validate(const TransferRequest& request,
                                                            FileSystem& source_fs,
                                                            FileSystem& destination_fs) {
  Target target;
  target.source = source_fs.resolve_absolute(request.source_path);
  auto info = source_fs.stat(target.source);
  if(!info) {
    throw TransferError(TransferErrorCode::SourceNotFound,
                        "source not found: " + target.source.string(), target.source);
  }
  if(info->kind != EntryKind::Directory && info->kind != EntryKind::File) {
    throw TransferError(TransferErrorCode::InvalidRequest,
                        "source is neither a file nor a directory: " + target.source.string(),
                        target.source);
  }
  target.source_is_directory = info->kind == EntryKind::Directory;

  target.destination = destination_fs.make_absolute(request.destination_path);
  auto existing = destination_fs.stat(target.destination);
  if(target.source_is_directory) {
    // the destination path becomes the mirror root
    if(existing && existing->kind != EntryKind::Directory) {
      throw TransferError(TransferErrorCode::DestinationExists,
                          "destination exists and is not a directory: " + target.destination.string(),
                          target.destination);
    }
    if(existing) return target;
  } else if(existing && existing->kind == EntryKind::Directory && !target.source.filename().empty()) {
    target.destination /= target.source.filename();
  }

  auto parent = target.destination.parent_path();
  if(!parent.empty() && !destination_fs.is_directory(parent)) {
    if(!request.force_create_parents) {
      throw TransferError(TransferErrorCode::DestinationFolderMissing,
                          "destination folder missing: " + parent.string(), parent);
    }
    logger_->info("creating destination folder {}", parent.string());
    destination_fs.make_directories(parent);
  }
  return target;
}

ChunkTransportOptions TransferOrchestrator::transport_options(const TransferRequest& request) const {
  ChunkTransportOptions transport;
  transport.buffer_size_bytes = request.buffer_size_bytes;
  transport.overwrite = request.overwrite;
  transport.retry = options_.retry;
  transport.progress = options_.progress;
  transport.cancel = options_.cancel;
  transport.logger = logger_.get();
  return transport;
}

TransferSummary TransferOrchestrator::copy_single(const TransferRequest& request,
                                                  const Target& target,
                                                  FileSystem& source_fs,
                                                  FileSystem& destination_fs) {
  enter(TransferState::Copying);
  TransferSummary summary;
  summary.bytes_copied = transfer_file(source_fs, target.source, destination_fs,
                                       target.destination, transport_options(request));
  summary.files_copied = 1;
  return summary;
}

TransferSummary TransferOrchestrator::copy_tree(const TransferRequest& request,
                                                const Target& target,
                                                FileSystem& source_fs,
                                                FileSystem& destination_fs) {
  enter(TransferState::Planning);
  TreePlanner planner(source_fs, target.source, logger_.get());
  auto plan = materialize_plan(planner);
  plan_issues_ = planner.issues();

  TransferSummary summary;
  std::vector<FailedJob> failed;
  // files, sub-directories and unreadable entries; each can land in `failed`
  std::size_t total_jobs = 0;

  auto abort_on = [&](const TransferError& e) {
    logger_->error("aborting tree copy: {}", e.what());
    throw AbortedTransfer(e, summary, failed);
  };

  for(const auto& issue : plan_issues_) {
    if(issue.skipped_link) continue;
    ++total_jobs;
    FailedJob job;
    job.job.source_file = target.source / issue.relative_path;
    job.code = TransferErrorCode::IoError;
    job.message = issue.message;
    failed.push_back(std::move(job));
  }

  enter(TransferState::Materializing);
  try {
    if(destination_fs.make_directories(target.destination)) ++summary.directories_created;
  } catch(const TransferError& e) {
    if(e.is_fatal()) abort_on(e);
    throw;
  }
  for(const auto& entry : plan) {
    if(entry.kind != PlanEntryKind::Directory) continue;
    ++total_jobs;
    auto destination_dir = target.destination / entry.relative_path;
    try {
      if(destination_fs.make_directories(destination_dir)) ++summary.directories_created;
    } catch(const TransferError& e) {
      if(e.is_fatal()) abort_on(e);
      logger_->warn("cannot create {}: {}", destination_dir.string(), e.what());
      failed.push_back(FailedJob{TransferJob{target.source / entry.relative_path, destination_dir},
                                 e.code(), e.what()});
    }
  }

  enter(TransferState::Copying);
  auto transport = transport_options(request);
  for(const auto& entry : plan) {
    if(entry.kind != PlanEntryKind::File) continue;
    ++total_jobs;
    TransferJob job{target.source / entry.relative_path, target.destination / entry.relative_path};
    try {
      auto bytes = transfer_file(source_fs, job.source_file, destination_fs, job.destination_file, transport);
      ++summary.files_copied;
      summary.bytes_copied += bytes;
    } catch(const TransferError& e) {
      if(e.is_fatal() || e.code() == TransferErrorCode::Cancelled) abort_on(e);
      logger_->warn("{} failed: {}", job.source_file.string(), e.what());
      failed.push_back(FailedJob{job, e.code(), e.what()});
    }
  }

  logger_->info("{} files, {} bytes, {} directories created",
                summary.files_copied, summary.bytes_copied, summary.directories_created);
  if(!failed.empty()) {
    throw PartialTreeFailure(std::move(failed), total_jobs, summary);
  }
  return summary;
}
