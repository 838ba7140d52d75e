#include "tree_planner.hpp"

#include <algorithm>

TreePlanner::TreePlanner(FileSystem& fs, const std::filesystem::path& source_root, Logger* logger)
  : fs_(fs), root_(fs.resolve_absolute(source_root)), logger_(logger) {
  if(!fs_.is_directory(root_)) {
    throw TransferError(TransferErrorCode::InvalidRequest,
                        "not a directory: " + root_.string(), root_);
  }
}

std::optional<DirectoryPlanEntry> TreePlanner::next() {
  while(ready_.empty()) {
    if(!root_expanded_) {
      root_expanded_ = true;
      expand({});
      continue;
    }
    if(pending_dirs_.empty()) return std::nullopt;
    auto dir = std::move(pending_dirs_.front());
    pending_dirs_.pop_front();
    expand(dir);
  }
  auto entry = std::move(ready_.front());
  ready_.pop_front();
  if(entry.kind == PlanEntryKind::Directory) {
    // children are listed only after their parent has been handed out
    pending_dirs_.push_back(entry.relative_path);
  }
  return entry;
}

void TreePlanner::expand(const std::filesystem::path& relative_dir) {
  auto absolute_dir = relative_dir.empty() ? root_ : root_ / relative_dir;
  std::vector<EntryInfo> entries;
  try {
    entries = fs_.list_entries(absolute_dir);
  } catch(const TransferError& e) {
    if(e.code() == TransferErrorCode::ChannelFault) throw;
    log_warn(logger_, "cannot enumerate {}: {}", absolute_dir.string(), e.what());
    issues_.push_back(PlanIssue{relative_dir.empty() ? std::filesystem::path(".") : relative_dir,
                                e.what(), false});
    return;
  }

  std::sort(entries.begin(), entries.end(),
            [](const EntryInfo& a, const EntryInfo& b){ return a.name < b.name; });

  std::vector<DirectoryPlanEntry> files;
  for(const auto& info : entries) {
    if(info.name.empty() || info.name == "." || info.name == "..") continue;
    auto rel = relative_dir / info.name;
    switch(info.kind) {
      case EntryKind::Directory:
        ready_.push_back(DirectoryPlanEntry{rel, PlanEntryKind::Directory, 0});
        break;
      case EntryKind::File:
        files.push_back(DirectoryPlanEntry{rel, PlanEntryKind::File, info.size});
        break;
      case EntryKind::Symlink:
      case EntryKind::Other:
        log_warn(logger_, "skipping {} {}", entry_kind_name(info.kind), (root_ / rel).string());
        issues_.push_back(PlanIssue{rel, std::string("skipped ") + entry_kind_name(info.kind), true});
        break;
    }
  }
  for(auto& file : files) {
    ready_.push_back(std::move(file));
  }
}

std::vector<DirectoryPlanEntry> materialize_plan(TreePlanner& planner) {
  std::vector<DirectoryPlanEntry> plan;
  while(auto entry = planner.next()) {
    plan.push_back(std::move(*entry));
  }
  std::stable_partition(plan.begin(), plan.end(), [](const DirectoryPlanEntry& e){
    return e.kind == PlanEntryKind::Directory;
  });
  return plan;
}
