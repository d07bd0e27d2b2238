/**
 * @file main.cpp
 * @brief Entry point for the ffstream command line tool
 *
 * @details Runs ffmpeg with the given arguments and reports its event
 *          sequence:
 *
 *          - Diagnostic events are printed one line each
 *
 *          - Frames and chunks are counted, not printed
 *
 *          - A summary is printed at the end
 *
 * @note Usage: ffstream [--version] [--quiet] -- <ffmpeg arguments...>
 *       Set FFSTREAM_TIMING=1 for a timing summary, FFSTREAM_VERBOSE=1 for
 *       debug logs.
 */

#include <cstdio>
#include <cstring>
#include <exception>
#include <string>
#include <vector>

#include "ffstream/command.hpp"
#include "ffstream/config.hpp"
#include "ffstream/logging.hpp"

using namespace ffstream;

namespace {

void print_usage() {
  LOG_WARN("Usage: ffstream [--version] [--quiet] -- <ffmpeg arguments...>");
}

/// One line per diagnostic event; payload events are only counted
struct EventPrinter {
  bool quiet;

  void operator()(const VersionEvent &e) const {
    if (!quiet)
      LOG_INFO("version: {}", e.version);
  }
  void operator()(const ConfigurationEvent &e) const {
    if (!quiet)
      LOG_INFO("configuration: {} flag(s)", e.configuration.size());
  }
  void operator()(const InputDescriptor &e) const {
    if (!quiet)
      LOG_INFO("input #{}", e.index);
  }
  void operator()(const InputDuration &e) const {
    if (!quiet)
      LOG_INFO("input #{} duration: {:.2f}s", e.input_index, e.duration);
  }
  void operator()(const OutputDescriptor &e) const {
    if (!quiet)
      LOG_INFO("output #{} -> {}{}", e.index, e.to,
               e.is_stdout() ? " (stdout)" : "");
  }
  void operator()(const StreamMappingEvent &) const {}
  void operator()(const InputStreamEvent &e) const {
    if (!quiet)
      LOG_INFO("input stream #{}:{} {}", e.stream.parent_index,
               e.stream.stream_index, e.stream.format);
  }
  void operator()(const OutputStreamEvent &e) const {
    if (quiet)
      return;
    if (const VideoInfo *video = e.stream.video()) {
      LOG_INFO("output stream #{}:{} {} {} {}x{} @ {} fps",
               e.stream.parent_index, e.stream.stream_index, e.stream.format,
               video->pix_fmt, video->width, video->height, video->fps);
    } else {
      LOG_INFO("output stream #{}:{} {}", e.stream.parent_index,
               e.stream.stream_index, e.stream.format);
    }
  }
  void operator()(const ProgressUpdate &e) const {
    if (!quiet)
      LOG_INFO("progress: frame={} time={} speed={}x", e.frame, e.time,
               e.speed);
  }
  void operator()(const LogEvent &e) const {
    if (e.level == LogLevel::Error || e.level == LogLevel::Fatal) {
      LOG_ERROR("{}", e.message);
    } else if (e.level == LogLevel::Warning && !quiet) {
      LOG_WARN("{}", e.message);
    } else {
      LOG_DEBUG("{}", e.message);
    }
  }
  void operator()(const LogEofEvent &) const {
    LOG_DEBUG("ffmpeg closed stderr");
  }
  void operator()(const ErrorEvent &e) const { LOG_ERROR("{}", e.message); }
  void operator()(const OutputFrame &) const {}
  void operator()(const OutputChunk &) const {}
  void operator()(const DoneEvent &) const { LOG_DEBUG("stdout drained"); }
};

int print_version() {
  try {
    LOG_SUCCESS("ffmpeg version {}", ffmpeg_version());
    return 0;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to query ffmpeg version: {}", e.what());
    return 1;
  }
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  bool quiet = false;
  std::vector<std::string> tool_args;

  int i = 1;
  for (; i < argc; ++i) {
    if (std::strcmp(argv[i], "--") == 0) {
      ++i;
      break;
    }
    if (std::strcmp(argv[i], "--version") == 0)
      return print_version();
    if (std::strcmp(argv[i], "--quiet") == 0) {
      quiet = true;
      continue;
    }
    LOG_ERROR("Unknown option: {}", argv[i]);
    print_usage();
    return 1;
  }
  for (; i < argc; ++i)
    tool_args.emplace_back(argv[i]);

  if (tool_args.empty()) {
    print_usage();
    return 1;
  }

  FfmpegCommand command;
  command.args(tool_args);
  if (!quiet)
    LOG_PHASE("{}", command.to_string());

  TIMER_START(total_run);
  TIMER_START(time_to_metadata);

  size_t frames = 0;
  size_t chunks = 0;
  size_t payload_bytes = 0;
  size_t errors = 0;
  int status = 0;

  try {
    ChildProcess child = command.spawn();
    {
      EventStream stream = child.events();
      EventPrinter printer{quiet};
      bool sealed = false;

      for (const Event &event : stream) {
        std::visit(printer, event);

        if (!sealed && stream.metadata().is_sealed()) {
          sealed = true;
          TIMER_END(time_to_metadata);
        }
        if (const auto *frame = std::get_if<OutputFrame>(&event)) {
          ++frames;
          payload_bytes += frame->data.size();
        } else if (const auto *chunk = std::get_if<OutputChunk>(&event)) {
          ++chunks;
          payload_bytes += chunk->data.size();
        } else if (error_message(event)) {
          ++errors;
        }
      }
    }
    status = child.wait();
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to run ffmpeg: {}", e.what());
    return 1;
  }

  TIMER_END(total_run);

  LOG_INFO("frames: {}, chunks: {}, payload bytes: {}", frames, chunks,
           payload_bytes);
  if (Config::timing()) {
    LOG_INFO("metadata sealed after {:.1f} ms",
             TimingCollector::total("time_to_metadata") / 1000.0);
    TimingCollector::print_summary();
  }

  if (errors > 0 || status != 0) {
    LOG_ERROR("ffmpeg finished with status {} and {} error(s)", status,
              errors);
    return 1;
  }
  LOG_SUCCESS("ffmpeg finished successfully");
  return 0;
}
