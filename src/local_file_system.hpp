#pragma once

#include <filesystem>

#include "file_system.hpp"

// POSIX-backed file system of the machine this process runs on.
class LocalFileSystem : public FileSystem {
public:
  // base_directory anchors relative paths; captured once, never re-read.
  explicit LocalFileSystem(std::filesystem::path base_directory = std::filesystem::current_path());

  std::string describe() const override;
  std::filesystem::path make_absolute(const std::filesystem::path& path) const override;
  std::optional<EntryInfo> stat(const std::filesystem::path& path) override;
  std::filesystem::path resolve_absolute(const std::filesystem::path& path) override;
  std::vector<EntryInfo> list_entries(const std::filesystem::path& directory) override;
  bool make_directories(const std::filesystem::path& path) override;
  std::unique_ptr<ReadStream> open_read(const std::filesystem::path& path) override;
  std::unique_ptr<WriteSink> open_for_write(const std::filesystem::path& path,
                                            WriteMode mode,
                                            bool overwrite) override;

  const std::filesystem::path& base_directory() const { return base_directory_; }

private:
  std::filesystem::path base_directory_;
};
