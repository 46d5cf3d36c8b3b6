#include "safedose/event_log.hpp"

#include <ostream>

namespace safedose {

void EventLog::log(LogLevel level, const std::string& line) {
  if (!enabled(level)) {
    return;
  }
  write(level, line);
}

void StreamEventLog::write(LogLevel level, const std::string& line) {
  // Flush errors immediately.
  out_ << line << '\n';
  if (level == LogLevel::ERROR) {
    out_.flush();
  }
}

} // namespace safedose
