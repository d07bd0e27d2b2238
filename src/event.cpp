/**
 * @file event.cpp
 * @brief Event helpers and OutputDescriptor::is_stdout
 */

#include "ffstream/event.hpp"

#include <array>

namespace ffstream {

// **---- Outputs ----**

bool OutputDescriptor::is_stdout() const {
  static const std::array<const char *, 4> aliases = {"pipe", "pipe:",
                                                      "pipe:1", "-"};
  for (const char *alias : aliases) {
    if (to == alias)
      return true;
  }
  return false;
}

// **---- Visitors ----**

namespace {

struct RawMessageVisitor {
  std::optional<std::string> operator()(const VersionEvent &e) const {
    return e.raw_log_message;
  }
  std::optional<std::string> operator()(const ConfigurationEvent &e) const {
    return e.raw_log_message;
  }
  std::optional<std::string> operator()(const InputDescriptor &e) const {
    return e.raw_log_message;
  }
  std::optional<std::string> operator()(const InputDuration &e) const {
    return e.raw_log_message;
  }
  std::optional<std::string> operator()(const OutputDescriptor &e) const {
    return e.raw_log_message;
  }
  std::optional<std::string> operator()(const StreamMappingEvent &e) const {
    return e.raw_log_message;
  }
  std::optional<std::string> operator()(const InputStreamEvent &e) const {
    return e.stream.raw_log_message;
  }
  std::optional<std::string> operator()(const OutputStreamEvent &e) const {
    return e.stream.raw_log_message;
  }
  std::optional<std::string> operator()(const ProgressUpdate &e) const {
    return e.raw_log_message;
  }
  std::optional<std::string> operator()(const LogEvent &e) const {
    return e.message;
  }
  template <typename T> std::optional<std::string> operator()(const T &) const {
    return std::nullopt;
  }
};

struct NameVisitor {
  const char *operator()(const VersionEvent &) const { return "version"; }
  const char *operator()(const ConfigurationEvent &) const {
    return "configuration";
  }
  const char *operator()(const InputDescriptor &) const { return "input"; }
  const char *operator()(const InputDuration &) const { return "duration"; }
  const char *operator()(const OutputDescriptor &) const { return "output"; }
  const char *operator()(const StreamMappingEvent &) const {
    return "stream_mapping";
  }
  const char *operator()(const InputStreamEvent &) const {
    return "input_stream";
  }
  const char *operator()(const OutputStreamEvent &) const {
    return "output_stream";
  }
  const char *operator()(const ProgressUpdate &) const { return "progress"; }
  const char *operator()(const LogEvent &) const { return "log"; }
  const char *operator()(const LogEofEvent &) const { return "log_eof"; }
  const char *operator()(const ErrorEvent &) const { return "error"; }
  const char *operator()(const OutputFrame &) const { return "output_frame"; }
  const char *operator()(const OutputChunk &) const { return "output_chunk"; }
  const char *operator()(const DoneEvent &) const { return "done"; }
};

} // anonymous namespace

std::optional<std::string> raw_log_message(const Event &event) {
  return std::visit(RawMessageVisitor{}, event);
}

std::optional<std::string> error_message(const Event &event) {
  if (const auto *error = std::get_if<ErrorEvent>(&event))
    return error->message;
  if (const auto *log = std::get_if<LogEvent>(&event)) {
    if (log->level == LogLevel::Error || log->level == LogLevel::Fatal)
      return log->message;
  }
  return std::nullopt;
}

const char *event_name(const Event &event) {
  return std::visit(NameVisitor{}, event);
}

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Info:
    return "info";
  case LogLevel::Warning:
    return "warning";
  case LogLevel::Error:
    return "error";
  case LogLevel::Fatal:
    return "fatal";
  case LogLevel::Unknown:
    break;
  }
  return "unknown";
}

} // namespace ffstream
