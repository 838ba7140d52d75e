#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

#include "chunk_transport.hpp"

// Single console line rewritten with '\r' while a file is copied; each
// finished file leaves one summary line behind.
class ProgressMeter {
public:
  explicit ProgressMeter(std::size_t meter_size = 80, std::ostream& out = std::cout);

  void update(const TransferProgress& progress);
  // Settles the current line, if any.
  void finish();

  ProgressCallback callback();

  // `slots` characters, each filled through a ramp of glyphs, then a percentage.
  static std::string format_meter(uint64_t done, uint64_t total, std::size_t slots);
  static std::string format_duration_compact(std::chrono::steady_clock::duration elapsed);

private:
  void render(const TransferProgress& progress, bool final_line);

  std::size_t meter_size_;
  std::ostream& out_;
  std::filesystem::path current_;
  bool active_ = false;
  std::size_t line_width_ = 0;
  std::chrono::steady_clock::time_point started_;
};
