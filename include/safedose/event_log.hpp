#pragma once

// Injected observability sink for simulation runs.
//
// The driver owns one EventLog and routes every human-readable notification
// through it. Nothing here is part of the programmatic contract: results are
// returned as values, the log only mirrors them for a human reader.

#include <cstdint>
#include <iosfwd>
#include <string>

namespace safedose {

enum class LogLevel : uint8_t {
  DEBUG = 0,  // Per-step traces
  INFO = 1,   // Banner, dosing events, report
  WARN = 2,   // Safety interlock engagement
  ERROR = 3
};

class EventLog {
public:
  explicit EventLog(LogLevel threshold = LogLevel::INFO) : threshold_(threshold) {}
  virtual ~EventLog() = default;

  EventLog(const EventLog&) = delete;
  EventLog& operator=(const EventLog&) = delete;

  // Emit one line if `level` passes the threshold.
  void log(LogLevel level, const std::string& line);

  bool enabled(LogLevel level) const { return level >= threshold_; }

protected:
  virtual void write(LogLevel level, const std::string& line) = 0;

private:
  LogLevel threshold_;
};

// Writes lines to a caller-owned stream (stdout in the example program).
class StreamEventLog final : public EventLog {
public:
  explicit StreamEventLog(std::ostream& out, LogLevel threshold = LogLevel::INFO)
      : EventLog(threshold), out_(out) {}

protected:
  void write(LogLevel level, const std::string& line) override;

private:
  std::ostream& out_;
};

// Discards everything.
class NullEventLog final : public EventLog {
public:
  NullEventLog() : EventLog(LogLevel::ERROR) {}

protected:
  void write(LogLevel, const std::string&) override {}
};

} // namespace safedose
