#include "events/jsonl_writer.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace modelpush::events {

bool AppendEventJsonl(const Event& event, const fs::path& output_dir, fs::path& written_path,
                      std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + output_dir.string() + "': " + ec.message();
    return false;
  }

  written_path = output_dir / kEventsFileName;
  std::ofstream out_file(written_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open event log '" + written_path.string() + "' for append";
    return false;
  }

  out_file << ToJson(event) << '\n';
  if (!out_file) {
    error = "failed while writing event log '" + written_path.string() + "'";
    return false;
  }

  return true;
}

EventLog::EventLog(fs::path output_dir) : output_dir_(std::move(output_dir)) {}

bool EventLog::Append(const Event& event, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  fs::path written_path;
  if (!AppendEventJsonl(event, output_dir_, written_path, error)) {
    return false;
  }
  ++written_count_;
  return true;
}

fs::path EventLog::Path() const {
  return output_dir_ / kEventsFileName;
}

std::uint64_t EventLog::WrittenCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return written_count_;
}

} // namespace modelpush::events
