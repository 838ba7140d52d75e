#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "file_system.hpp"
#include "protocol.hpp"
#include "remote_channel.hpp"

// FileSystem of the machine at the other end of a RemoteChannel. Every probe
// is one request; streams map onto read/open_write/write/close requests.
class RemoteFileSystem : public FileSystem {
public:
  // Performs the hello exchange; relative paths are anchored at the agent root.
  explicit RemoteFileSystem(std::shared_ptr<RemoteChannel> channel);

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
  std::optional<std::size_t> max_write_size() const override { return max_write_; }

  const std::filesystem::path& root() const { return root_; }

private:
  std::shared_ptr<RemoteChannel> channel_;
  std::filesystem::path root_;
  std::size_t max_write_ = kMaxWriteLength;
};
