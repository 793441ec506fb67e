#pragma once

#include "config.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace study {

namespace events {
constexpr const char* kItemPresented = "item_presented";
constexpr const char* kItemResponse = "item_response";
constexpr const char* kTopicTransition = "topic_transition";
constexpr const char* kRetentionEvent = "retention_event";
constexpr const char* kDegenerateUpdate = "degenerate_update";
constexpr const char* kEngineWarning = "engine_warning";
constexpr const char* kSessionStop = "session_stop";
} // namespace events

struct TelemetryEvent {
  std::uint64_t sequence = 0;
  std::string type;
  nlohmann::json payload;
};

// A sink reports a failed write by throwing.
class TelemetrySink {
public:
  virtual ~TelemetrySink() = default;
  virtual void write(const TelemetryEvent& event) = 0;
};

class MemorySink : public TelemetrySink {
public:
  void write(const TelemetryEvent& event) override;

  std::vector<TelemetryEvent> events() const;
  std::vector<TelemetryEvent> events_of(const std::string& type) const;
  std::size_t size() const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::vector<TelemetryEvent> events_;
};

// One JSON object per line: {"seq", "type", "payload"}.
class JsonLinesSink : public TelemetrySink {
public:
  explicit JsonLinesSink(const std::filesystem::path& path);
  void write(const TelemetryEvent& event) override;

private:
  std::mutex mutex_;
  std::filesystem::path path_;
  std::ofstream stream_;
};

struct TelemetryStats {
  std::uint64_t emitted = 0;
  std::uint64_t written = 0;
  std::uint64_t retries = 0;
  std::uint64_t dropped_overflow = 0;
  std::uint64_t dropped_failed = 0;

  std::uint64_t dropped() const { return dropped_overflow + dropped_failed; }
};

class TelemetryEmitter {
public:
  TelemetryEmitter(std::shared_ptr<TelemetrySink> sink, TelemetryConfig config = {});
  ~TelemetryEmitter();

  TelemetryEmitter(const TelemetryEmitter&) = delete;
  TelemetryEmitter& operator=(const TelemetryEmitter&) = delete;

  // Never blocks on the sink and never throws. Returns false when the event
  // was dropped because the buffer is full.
  bool emit(const std::string& type, nlohmann::json payload);

  // Waits until every buffered event has been written or dropped.
  void flush();

  TelemetryStats stats() const;

  bool asynchronous() const noexcept { return config_.asynchronous; }

private:
  void run();
  void deliver(const TelemetryEvent& event);

  std::shared_ptr<TelemetrySink> sink_;
  TelemetryConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable work_ready_;
  std::condition_variable drained_;
  std::deque<TelemetryEvent> queue_;
  bool writing_ = false;
  bool stopping_ = false;
  std::uint64_t next_sequence_ = 1;
  TelemetryStats stats_;
  std::thread writer_;
};

} // namespace study
