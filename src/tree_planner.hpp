#pragma once

#include <cstdint>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "file_system.hpp"
#include "log.hpp"

enum class PlanEntryKind { Directory, File };

struct DirectoryPlanEntry {
  std::filesystem::path relative_path;  // relative to the copy root, never empty
  PlanEntryKind kind = PlanEntryKind::File;
  uint64_t size = 0;
};

struct PlanIssue {
  std::filesystem::path relative_path;
  std::string message;
  bool skipped_link = false;  // symlink or special file left out, not an error
};

// Single-pass breadth-first walk below a source root. A directory's entry is
// always produced before anything beneath it. Within one directory,
// subdirectories come first, then files, each sorted by name.
//
// Symlinks and special files are skipped and recorded as issues. A directory
// that cannot be listed is recorded as an issue and the walk continues.
class TreePlanner {
public:
  // Resolves source_root once; throws PathNotFound when it does not exist.
  TreePlanner(FileSystem& fs, const std::filesystem::path& source_root, Logger* logger = nullptr);

  TreePlanner(const TreePlanner&) = delete;
  TreePlanner& operator=(const TreePlanner&) = delete;

  // Next entry, or nullopt once the walk is exhausted.
  std::optional<DirectoryPlanEntry> next();

  const std::filesystem::path& root() const { return root_; }
  const std::vector<PlanIssue>& issues() const { return issues_; }

private:
  void expand(const std::filesystem::path& relative_dir);

  FileSystem& fs_;
  std::filesystem::path root_;
  Logger* logger_;
  std::deque<std::filesystem::path> pending_dirs_;
  std::deque<DirectoryPlanEntry> ready_;
  std::vector<PlanIssue> issues_;
  bool root_expanded_ = false;
};

// Drains a planner; directories first in traversal order, then files.
std::vector<DirectoryPlanEntry> materialize_plan(TreePlanner& planner);
