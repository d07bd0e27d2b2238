/**
 * @file event.hpp
 * @brief The closed set of events produced while ffmpeg runs
 *
 * @details An Event is a std::variant over one struct per event kind.
 *          Diagnostic events come from the stderr line parser, payload
 *          events (frames, chunks, done) come from the stdout demuxer, and
 *          ErrorEvent can come from either worker or from the orchestrator.
 */

#ifndef FFSTREAM_EVENT_HPP
#define FFSTREAM_EVENT_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "types.hpp"

namespace ffstream {

/// Severity tag embedded by "-loglevel level+info", e.g. "[warning]"
enum class LogLevel { Info, Warning, Error, Fatal, Unknown };

/// "ffmpeg version <token> ..."
struct VersionEvent {
  std::string version;
  std::string raw_log_message;
};

/// "configuration: --enable-gpl --enable-libx264 ..."
struct ConfigurationEvent {
  std::vector<std::string> configuration;
  std::string raw_log_message;
};

/// "  Stream #0:0 -> #0:0 (...)" below "Stream mapping:"
struct StreamMappingEvent {
  std::string raw_log_message;
};

struct InputStreamEvent {
  StreamDescriptor stream;
};

struct OutputStreamEvent {
  StreamDescriptor stream;
};

/// Any line not matched by a more specific rule
struct LogEvent {
  LogLevel level = LogLevel::Unknown;
  std::string message; //< The full original line
};

/// The diagnostic stream reached end of file (emitted once)
struct LogEofEvent {};

/// Grammar, I/O, decoding, metadata or configuration failure
struct ErrorEvent {
  std::string message;
};

/// The stdout demuxer finished (emitted once)
struct DoneEvent {};

using Event =
    std::variant<VersionEvent, ConfigurationEvent, InputDescriptor,
                 InputDuration, OutputDescriptor, StreamMappingEvent,
                 InputStreamEvent, OutputStreamEvent, ProgressUpdate, LogEvent,
                 LogEofEvent, ErrorEvent, OutputFrame, OutputChunk, DoneEvent>;

/**
 * @brief Original diagnostic line carried by an event.
 * @return The line text, or nullopt for events that did not come from a
 *         line (EOF, errors, frames, chunks, done).
 */
std::optional<std::string> raw_log_message(const Event &event);

/**
 * @brief Error text of an event.
 * @return Message for ErrorEvent and for error/fatal log lines, else nullopt
 */
std::optional<std::string> error_message(const Event &event);

/// Short kind name for logging, e.g. "progress", "output_frame"
const char *event_name(const Event &event);

/// "info", "warning", "error", "fatal", "unknown"
const char *log_level_name(LogLevel level);

} // namespace ffstream

#endif // FFSTREAM_EVENT_HPP
