#include "study/telemetry.hpp"

#include "debug_log.hpp"

#include <chrono>
#include <stdexcept>

namespace study {

namespace {

bool telemetry_debug() {
  static const bool enabled = debug_flag_enabled("STUDY_DEBUG_TELEMETRY");
  return enabled;
}

} // namespace

void MemorySink::write(const TelemetryEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<TelemetryEvent> MemorySink::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<TelemetryEvent> MemorySink::events_of(const std::string& type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TelemetryEvent> out;
  for (const auto& event : events_) {
    if (event.type == type) {
      out.push_back(event);
    }
  }
  return out;
}

std::size_t MemorySink::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

void MemorySink::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.clear();
}

JsonLinesSink::JsonLinesSink(const std::filesystem::path& path)
    : path_(path), stream_(path, std::ios::app) {
  if (!stream_) {
    throw std::runtime_error("Failed to open telemetry log: " + path.string());
  }
}

void JsonLinesSink::write(const TelemetryEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json line = {
      {"seq", event.sequence},
      {"type", event.type},
      {"payload", event.payload},
  };
  stream_ << line.dump() << '\n';
  stream_.flush();
  if (!stream_) {
    stream_.clear();
    throw std::runtime_error("Failed to append to telemetry log: " + path_.string());
  }
}

TelemetryEmitter::TelemetryEmitter(std::shared_ptr<TelemetrySink> sink, TelemetryConfig config)
    : sink_(std::move(sink)), config_(config) {
  if (config_.max_attempts < 1) {
    throw std::invalid_argument("TelemetryEmitter: max_attempts must be at least 1");
  }
  if (config_.queue_capacity == 0) {
    throw std::invalid_argument("TelemetryEmitter: queue capacity must be positive");
  }
  if (config_.asynchronous && sink_) {
    writer_ = std::thread([this]() { run(); });
  }
}

TelemetryEmitter::~TelemetryEmitter() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  work_ready_.notify_all();
  if (writer_.joinable()) {
    writer_.join();
  }
}

bool TelemetryEmitter::emit(const std::string& type, nlohmann::json payload) {
  if (!sink_) {
    return true;
  }
  TelemetryEvent event;
  event.type = type;
  event.payload = std::move(payload);

  if (!config_.asynchronous) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      event.sequence = next_sequence_++;
      ++stats_.emitted;
    }
    deliver(event);
    return true;
  }

  bool overflow = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    event.sequence = next_sequence_++;
    ++stats_.emitted;
    if (queue_.size() >= config_.queue_capacity) {
      ++stats_.dropped_overflow;
      overflow = true;
    } else {
      queue_.push_back(std::move(event));
    }
  }
  if (overflow) {
    if (telemetry_debug()) {
      debug_line("telemetry", "buffer full, dropping " + type + " #" +
                                  std::to_string(event.sequence));
    }
    return false;
  }
  work_ready_.notify_one();
  return true;
}

void TelemetryEmitter::flush() {
  if (!config_.asynchronous) {
    return;
  }
  std::unique_lock<std::mutex> lock(mutex_);
  drained_.wait(lock, [this]() { return queue_.empty() && !writing_; });
}

TelemetryStats TelemetryEmitter::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void TelemetryEmitter::run() {
  for (;;) {
    TelemetryEvent event;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_ready_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        drained_.notify_all();
        return;
      }
      event = std::move(queue_.front());
      queue_.pop_front();
      writing_ = true;
    }
    deliver(event);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      writing_ = false;
      if (queue_.empty()) {
        drained_.notify_all();
      }
    }
  }
}

void TelemetryEmitter::deliver(const TelemetryEvent& event) {
  for (int attempt = 1; attempt <= config_.max_attempts; ++attempt) {
    try {
      sink_->write(event);
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.written;
      return;
    } catch (const std::exception& ex) {
      if (telemetry_debug()) {
        debug_line("telemetry", "write of " + event.type + " #" + std::to_string(event.sequence) +
                                    " failed (attempt " + std::to_string(attempt) + "): " +
                                    ex.what());
      }
    } catch (...) {
      if (telemetry_debug()) {
        debug_line("telemetry", "write of " + event.type + " #" + std::to_string(event.sequence) +
                                    " failed (attempt " + std::to_string(attempt) +
                                    "): non-standard exception");
      }
    }
    if (attempt < config_.max_attempts) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.retries;
      }
      if (config_.asynchronous && config_.retry_backoff_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.retry_backoff_ms * attempt));
      }
    }
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.dropped_failed;
  }
  if (telemetry_debug()) {
    debug_line("telemetry", "dropping " + event.type + " #" + std::to_string(event.sequence) +
                                " after " + std::to_string(config_.max_attempts) + " attempts");
  }
}

} // namespace study
