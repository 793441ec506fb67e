#include "study/telemetry.hpp"

#include "test_support.hpp"

#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using study::testing::TestSuite;

namespace {

// Fails the first `failures` writes.
class FlakySink : public study::TelemetrySink {
public:
  explicit FlakySink(int failures) : failures_(failures) {}

  void write(const study::TelemetryEvent& event) override {
    ++attempts;
    if (failures_ > 0) {
      --failures_;
      throw std::runtime_error("disk full");
    }
    delivered.push_back(event);
  }

  int attempts = 0;
  std::vector<study::TelemetryEvent> delivered;

private:
  int failures_;
};

// Blocks inside write() until opened.
class GateSink : public study::TelemetrySink {
public:
  void write(const study::TelemetryEvent& event) override {
    std::unique_lock<std::mutex> lock(mutex_);
    entered_ = true;
    changed_.notify_all();
    changed_.wait(lock, [this]() { return open_; });
    delivered_.push_back(event.sequence);
  }

  void wait_until_entered() {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait(lock, [this]() { return entered_; });
  }

  void open() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
    changed_.notify_all();
  }

  std::vector<std::uint64_t> delivered() {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
  }

private:
  std::mutex mutex_;
  std::condition_variable changed_;
  bool entered_ = false;
  bool open_ = false;
  std::vector<std::uint64_t> delivered_;
};

// Throws something that is not a std::exception.
class RawThrowSink : public study::TelemetrySink {
public:
  void write(const study::TelemetryEvent&) override {
    ++attempts;
    throw 42;
  }

  int attempts = 0;
};

study::TelemetryConfig sync_config() {
  study::TelemetryConfig config;
  config.asynchronous = false;
  return config;
}

} // namespace

int main() {
  TestSuite suite;

  {
    auto sink = std::make_shared<study::MemorySink>();
    study::TelemetryEmitter emitter(sink, sync_config());
    for (int i = 0; i < 3; ++i) {
      suite.require(emitter.emit(study::events::kItemPresented, {{"index", i}}),
                    "Synchronous emit should succeed");
    }
    auto events = sink->events();
    suite.require(events.size() == 3, "Every event should reach the sink");
    suite.require(events[0].sequence == 1 && events[2].sequence == 3,
                  "Sequence numbers should start at 1 and increase");
    suite.require(events[1].payload["index"].get<int>() == 1, "Payload should be kept intact");
    suite.require(emitter.stats().written == 3 && emitter.stats().dropped() == 0,
                  "Stats should count written events");
  }

  {
    auto sink = std::make_shared<FlakySink>(2);
    study::TelemetryEmitter emitter(sink, sync_config());
    emitter.emit(study::events::kItemResponse, {{"item_id", "x"}});
    const auto stats = emitter.stats();
    suite.require(sink->attempts == 3 && sink->delivered.size() == 1,
                  "Failed writes should be retried");
    suite.require(stats.retries == 2 && stats.written == 1 && stats.dropped_failed == 0,
                  "Retries should be counted without dropping the event");
  }

  {
    auto sink = std::make_shared<FlakySink>(100);
    study::TelemetryEmitter emitter(sink, sync_config());
    const bool accepted = emitter.emit(study::events::kSessionStop, {{"reason", "requested"}});
    const auto stats = emitter.stats();
    suite.require(accepted, "A failing sink must not fail the caller");
    suite.require(sink->attempts == 3, "Delivery should give up after max attempts");
    suite.require(stats.dropped_failed == 1 && stats.written == 0,
                  "An undeliverable event should be counted as dropped");
  }

  {
    auto sink = std::make_shared<RawThrowSink>();
    study::TelemetryEmitter emitter(sink, sync_config());
    bool escaped = false;
    bool accepted = false;
    try {
      accepted = emitter.emit(study::events::kItemPresented, {{"index", 0}});
    } catch (const int&) {
      escaped = true;
    }
    suite.require(!escaped && accepted, "Non-standard sink exceptions must not reach the caller");
    suite.require(sink->attempts == 3 && emitter.stats().dropped_failed == 1,
                  "Non-standard sink exceptions should be retried, then counted as dropped");
  }

  {
    auto sink = std::make_shared<study::MemorySink>();
    {
      study::TelemetryEmitter emitter(sink);
      for (int i = 0; i < 100; ++i) {
        emitter.emit(study::events::kItemPresented, {{"index", i}});
      }
      emitter.flush();
      suite.require(sink->size() == 100, "Flush should drain the asynchronous buffer");
      suite.require(emitter.stats().written == 100, "Asynchronous writes should be counted");
    }
    auto events = sink->events();
    bool ordered = true;
    for (std::size_t i = 1; i < events.size(); ++i) {
      ordered = ordered && events[i].sequence == events[i - 1].sequence + 1;
    }
    suite.require(ordered, "The writer should preserve emission order");
  }

  {
    auto sink = std::make_shared<GateSink>();
    study::TelemetryConfig config;
    config.queue_capacity = 2;
    study::TelemetryEmitter emitter(sink, config);
    emitter.emit("first", nlohmann::json::object());
    sink->wait_until_entered();
    suite.require(emitter.emit("second", nlohmann::json::object()), "Buffer slot 1 should accept");
    suite.require(emitter.emit("third", nlohmann::json::object()), "Buffer slot 2 should accept");
    suite.require(!emitter.emit("fourth", nlohmann::json::object()),
                  "A full buffer should drop instead of blocking");
    sink->open();
    emitter.flush();
    const auto stats = emitter.stats();
    suite.require(stats.dropped_overflow == 1 && stats.written == 3,
                  "Overflow drops should be counted separately");
    suite.require(sink->delivered() == std::vector<std::uint64_t>({1, 2, 3}),
                  "Accepted events should be delivered in order");
  }

  {
    study::TelemetryEmitter emitter(nullptr);
    suite.require(emitter.emit("anything", nlohmann::json::object()),
                  "Without a sink telemetry is a no-op");
    emitter.flush();
    suite.require(emitter.stats().emitted == 0, "Nothing is counted without a sink");
  }

  {
    const auto path = std::filesystem::temp_directory_path() / "study_telemetry_test.jsonl";
    std::filesystem::remove(path);
    {
      auto sink = std::make_shared<study::JsonLinesSink>(path);
      study::TelemetryEmitter emitter(sink, sync_config());
      emitter.emit(study::events::kRetentionEvent, {{"card_id", "card-x"}, {"result", "lapse"}});
      emitter.emit(study::events::kEngineWarning, {{"issue", "no_eligible_item"}});
    }
    std::ifstream stream(path);
    std::vector<nlohmann::json> lines;
    std::string line;
    while (std::getline(stream, line)) {
      lines.push_back(nlohmann::json::parse(line));
    }
    suite.require(lines.size() == 2, "Each event should be one JSON line");
    if (lines.size() == 2) {
      suite.require(lines[0]["type"] == "retention_event" && lines[0]["seq"] == 1,
                    "Lines should carry type and sequence");
      suite.require(lines[1]["payload"]["issue"] == "no_eligible_item",
                    "Lines should carry the payload");
    }
    std::filesystem::remove(path);
  }

  if (!suite.ok) {
    std::cerr << "Telemetry tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Telemetry tests passed" << std::endl;
  return 0;
}
