#include "progress_meter.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "utils.hpp"

namespace {

constexpr char kMeterChars[] = {' ', '.', '_', 'v', 'Y', 'X', 'H', '#'};
constexpr std::size_t kMeterCharCount = sizeof(kMeterChars) / sizeof(kMeterChars[0]);

// width left for the bar once the label and counters are printed
constexpr std::size_t kMeterOverhead = 48;

} // namespace

ProgressMeter::ProgressMeter(std::size_t meter_size, std::ostream& out)
  : meter_size_(meter_size), out_(out) {}

ProgressCallback ProgressMeter::callback() {
  return [this](const TransferProgress& progress){ update(progress); };
}

std::string ProgressMeter::format_meter(uint64_t done, uint64_t total, std::size_t slots) {
  slots = std::max<std::size_t>(1, slots);
  std::string bar;
  bar.reserve(slots);
  if(total == 0) {
    bar.assign(slots, kMeterChars[kMeterCharCount - 1]);
  } else {
    done = std::min(done, total);
    auto scaled_position = [total, slots](std::size_t idx) -> uint64_t {
      uint64_t base = (total / slots) * idx;
      uint64_t remainder = (total % slots) * idx / slots;
      return base + remainder;
    };
    for(std::size_t slot = 0; slot < slots; ++slot) {
      uint64_t slot_start = scaled_position(slot);
      uint64_t slot_end = std::max(scaled_position(slot + 1), slot_start + 1);
      slot_end = std::min(slot_end, total);
      if(slot_start >= total || done <= slot_start) {
        bar.push_back(kMeterChars[0]);
        continue;
      }
      const uint64_t slot_len = slot_end - slot_start;
      const uint64_t filled = std::min(done, slot_end) - slot_start;
      double ratio = static_cast<double>(filled) / static_cast<double>(slot_len);
      std::size_t index = static_cast<std::size_t>(std::clamp(ratio, 0.0, 1.0) * static_cast<double>(kMeterCharCount));
      if(index >= kMeterCharCount) index = kMeterCharCount - 1;
      bar.push_back(kMeterChars[index]);
    }
  }
  double percent = total == 0
    ? 100.0
    : static_cast<double>(done) / static_cast<double>(total) * 100.0;
  std::ostringstream oss;
  oss << "[" << bar << "] " << std::fixed << std::setprecision(1) << percent << "%";
  return oss.str();
}

std::string ProgressMeter::format_duration_compact(std::chrono::steady_clock::duration elapsed) {
  double value = std::chrono::duration<double>(elapsed).count();
  char unit = 's';
  if(value >= 60.0) {
    value /= 60.0;
    unit = 'm';
    if(value >= 60.0) {
      value /= 60.0;
      unit = 'h';
    }
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(value >= 10.0 ? 0 : 1) << value << unit;
  return oss.str();
}

void ProgressMeter::update(const TransferProgress& progress) {
  if(!active_ || progress.source_file != current_) {
    if(active_) finish();
    current_ = progress.source_file;
    started_ = std::chrono::steady_clock::now();
    active_ = true;
  }
  bool done = progress.bytes_transferred >= progress.total_bytes;
  render(progress, done);
  if(done) {
    out_ << "\n";
    out_.flush();
    active_ = false;
    line_width_ = 0;
  }
}

void ProgressMeter::render(const TransferProgress& progress, bool final_line) {
  auto elapsed = std::chrono::steady_clock::now() - started_;
  double seconds = std::chrono::duration<double>(elapsed).count();

  std::size_t slots = meter_size_ > kMeterOverhead ? meter_size_ - kMeterOverhead : 10;
  std::string name = progress.source_file.filename().string();
  if(name.size() > 24) name = name.substr(0, 21) + "...";

  std::ostringstream line;
  line << "\r" << std::left << std::setw(24) << name << " "
       << format_meter(progress.bytes_transferred, progress.total_bytes, slots)
       << " " << format_size(progress.bytes_transferred) << "/" << format_size(progress.total_bytes);
  if(seconds > 0.05) {
    line << " " << format_size(static_cast<uint64_t>(static_cast<double>(progress.bytes_transferred) / seconds)) << "/s";
  }
  if(final_line) {
    line << " " << format_duration_compact(elapsed);
  }
  auto rendered = line.str();
  out_ << rendered;
  if(rendered.size() < line_width_) {
    out_ << std::string(line_width_ - rendered.size(), ' ');
  } else {
    line_width_ = rendered.size();
  }
  out_.flush();
}

void ProgressMeter::finish() {
  if(!active_) return;
  out_ << "\n";
  out_.flush();
  active_ = false;
  line_width_ = 0;
}
