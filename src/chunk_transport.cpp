#include "chunk_transport.hpp"

#include <algorithm>
#include <vector>

namespace {

// Fills exactly `size` bytes; a short stream is fatal.
void read_exact(ReadStream& stream, const std::filesystem::path& source,
                char* buffer, std::size_t size, uint64_t offset) {
  std::size_t filled = 0;
  while(filled < size) {
    std::size_t n = stream.read_some(buffer + filled, size - filled);
    if(n == 0) {
      throw TransferError(TransferErrorCode::TruncatedSource,
                          "source ended at byte " + std::to_string(offset + filled) +
                          ", expected " + std::to_string(offset + size),
                          source);
    }
    filled += n;
  }
}

void check_cancelled(const ChunkTransportOptions& options, const std::filesystem::path& source) {
  if(options.cancel && options.cancel->cancelled()) {
    throw TransferError(TransferErrorCode::Cancelled, "transfer cancelled", source);
  }
}

} // namespace

uint64_t transfer_file(FileSystem& source_fs,
                       const std::filesystem::path& source_file,
                       FileSystem& destination_fs,
                       const std::filesystem::path& destination_file,
                       const ChunkTransportOptions& options) {
  if(options.buffer_size_bytes == 0) {
    throw TransferError(TransferErrorCode::InvalidRequest, "buffer size must be > 0", source_file);
  }
  check_cancelled(options, source_file);

  auto source = source_fs.open_read(source_file);
  const uint64_t source_length = source->length();

  auto sink = options.retry.open_for_write(destination_fs, destination_file,
                                           WriteMode::Create, options.overwrite);

  TransferProgress progress{source_file, destination_file, 0, source_length};
  if(options.progress) options.progress(progress);

  std::size_t buffer_size = static_cast<std::size_t>(
    std::min<uint64_t>(options.buffer_size_bytes, source_length));
  std::vector<char> buffer(buffer_size);
  uint64_t transferred = 0;
  std::size_t chunks = 0;

  while(transferred < source_length) {
    check_cancelled(options, source_file);
    const uint64_t remaining = source_length - transferred;
    if(remaining < buffer_size) {
      buffer_size = static_cast<std::size_t>(remaining);
    }
    read_exact(*source, source_file, buffer.data(), buffer_size, transferred);
    sink->write(buffer.data(), buffer_size);
    transferred += buffer_size;
    ++chunks;

    progress.bytes_transferred = transferred;
    if(options.progress) options.progress(progress);
  }

  sink->close();
  log_debug(options.logger, "{} -> {}: {} bytes in {} chunks",
            source_file.string(), destination_file.string(), transferred, chunks);
  return transferred;
}
