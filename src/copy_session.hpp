#pragma once

#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

#include "chunk_transport.hpp"
#include "log.hpp"
#include "retry_policy.hpp"
#include "transfer_orchestrator.hpp"

class FileSystem;
class RemoteChannel;
class SettingsManager;

// One rcopy invocation: settings in, channel and file systems built, the
// orchestrator run, a report printed.
class CopySession {
public:
  enum ExitCode {
    kExitOk = 0,
    kExitFailed = 1,
    kExitPartial = 2,   // tree copy finished with failed files
    kExitAborted = 3    // tree copy stopped early (channel fault or cancel)
  };

  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    std::ostream* progress_out = &std::cout;
  };

  CopySession(std::shared_ptr<SettingsManager> settings, Options options);
  CopySession(std::shared_ptr<SettingsManager> settings);
  ~CopySession();

  TransferRequest make_request() const;
  LockRetryPolicy make_retry_policy() const;

  // host empty: in-process agent rooted at remote_root. Otherwise TCP.
  std::shared_ptr<RemoteChannel> connect();

  // Throws the orchestrator's errors.
  TransferSummary execute();

  // Runs execute() and prints the outcome; returns an ExitCode.
  int run();

  void cancel() { cancel_.cancel(); }

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  const std::vector<PlanIssue>& plan_issues() const { return plan_issues_; }

private:
  void report_failures(const std::vector<FailedJob>& failed) const;
  void report_issues() const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  CancelToken cancel_;
  std::vector<PlanIssue> plan_issues_;
};
