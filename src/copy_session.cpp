#include "copy_session.hpp"

#include <chrono>
#include <stdexcept>

#include "local_file_system.hpp"
#include "progress_meter.hpp"
#include "remote_channel.hpp"
#include "remote_file_system.hpp"
#include "settings_manager.hpp"
#include "tcp_channel.hpp"
#include "utils.hpp"

CopySession::CopySession(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("rcopy")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

CopySession::CopySession(std::shared_ptr<SettingsManager> settings)
  : CopySession(std::move(settings), Options{}) {}

CopySession::~CopySession() = default;

TransferRequest CopySession::make_request() const {
  TransferRequest request;
  request.source_path = settings_->get<std::string>("source");
  request.destination_path = settings_->get<std::string>("destination");
  request.direction = settings_->get<std::string>("direction") == "pull"
    ? TransferDirection::Pull
    : TransferDirection::Push;
  request.buffer_size_bytes = static_cast<std::size_t>(settings_->get<uint64_t>("buffer_size"));
  request.overwrite = settings_->get<bool>("overwrite");
  request.force_create_parents = settings_->get<bool>("force");
  return request;
}

LockRetryPolicy CopySession::make_retry_policy() const {
  int max_tries = settings_->get<int>("max_tries");
  int delay_ms = settings_->get<int>("retry_delay_ms");
  return LockRetryPolicy(static_cast<std::size_t>(max_tries < 1 ? 1 : max_tries),
                         std::chrono::milliseconds(delay_ms < 0 ? 0 : delay_ms),
                         logger_.get());
}

std::shared_ptr<RemoteChannel> CopySession::connect() {
  auto host = settings_->get<std::string>("host");
  if(host.empty()) {
    auto root = absolute_normalized(settings_->get<std::string>("remote_root"), options_.workspace_root);
    logger_->debug("no host given, using in-process agent at {}", root.string());
    return std::make_shared<LoopbackChannel>(root, logger_);
  }
  int port = settings_->get<int>("port");
  if(port <= 0 || port > 65535) {
    throw TransferError(TransferErrorCode::InvalidRequest, "Invalid port " + std::to_string(port));
  }
  return std::make_shared<TcpChannel>(host, static_cast<uint16_t>(port), logger_);
}

TransferSummary CopySession::execute() {
  init(settings_->get<bool>("verbose"));
  plan_issues_.clear();
  for(const auto& spec : settings_->setting_specs()) {
    logger_->debug("{} = {}", spec.key, settings_->value_as_string(spec.key));
  }

  auto request = make_request();
  LocalFileSystem local_fs(options_.workspace_root);
  RemoteFileSystem remote_fs(connect());

  std::unique_ptr<ProgressMeter> meter;
  OrchestratorOptions orchestrator_options;
  orchestrator_options.retry = make_retry_policy();
  orchestrator_options.cancel = &cancel_;
  if(settings_->get<bool>("progress") && options_.progress_out) {
    meter = std::make_unique<ProgressMeter>(
      static_cast<std::size_t>(settings_->get<int>("progress_meter_size")), *options_.progress_out);
    orchestrator_options.progress = meter->callback();
  }

  TransferOrchestrator orchestrator(local_fs, remote_fs, orchestrator_options, logger_);
  try {
    auto summary = orchestrator.copy(request);
    if(meter) meter->finish();
    plan_issues_ = orchestrator.plan_issues();
    return summary;
  } catch(const TransferError&) {
    if(meter) meter->finish();
    plan_issues_ = orchestrator.plan_issues();
    throw;
  }
}

void CopySession::report_failures(const std::vector<FailedJob>& failed) const {
  for(const auto& job : failed) {
    logger_->print_err("  {} [{}] {}", job.job.source_file.string(), error_code_name(job.code), job.message);
  }
}

void CopySession::report_issues() const {
  for(const auto& issue : plan_issues_) {
    if(issue.skipped_link) {
      logger_->print("skipped {}: {}", issue.relative_path.string(), issue.message);
    }
  }
}

int CopySession::run() {
  try {
    auto summary = execute();
    report_issues();
    logger_->print("{} file(s), {}, {} director{} created",
                   summary.files_copied, format_size(summary.bytes_copied),
                   summary.directories_created, summary.directories_created == 1 ? "y" : "ies");
    return kExitOk;
  } catch(const PartialTreeFailure& e) {
    report_issues();
    logger_->print_err("{} of {} entries failed; {} file(s) copied, {}",
                       e.failed_jobs().size(), e.total_jobs(),
                       e.summary().files_copied, format_size(e.summary().bytes_copied));
    report_failures(e.failed_jobs());
    return kExitPartial;
  } catch(const AbortedTransfer& e) {
    logger_->print_err("aborted: {}", e.what());
    logger_->print_err("{} file(s) copied before the abort, {}",
                       e.completed().files_copied, format_size(e.completed().bytes_copied));
    report_failures(e.failed_jobs());
    return kExitAborted;
  } catch(const TransferError& e) {
    logger_->print_err("{} [{}]", e.what(), error_code_name(e.code()));
    return kExitFailed;
  }
}
