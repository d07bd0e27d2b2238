/**
 * @file event_stream.cpp
 * @brief EventStream implementation: workers, inline metadata fold, control
 */

#include "ffstream/event_stream.hpp"

#include <exception>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>

#include "ffstream/config.hpp"
#include "ffstream/demuxer.hpp"
#include "ffstream/log_parser.hpp"
#include "ffstream/logging.hpp"

namespace ffstream {

// **---- Workers ----**

namespace {

/**
 * @brief Stderr worker body.
 * @note Stops after LogEof, after a parse/read failure (reported as an
 *       ErrorEvent), or silently once the receiver is gone.
 */
void run_parser(FileHandle source, Sender<Event> tx) {
  LOG_DEBUG("Diagnostic parser started");
  try {
    LogParser parser(std::move(source));
    while (auto event = parser.parse_next_event()) {
      bool eof = std::holds_alternative<LogEofEvent>(*event);
      if (!tx.send(std::move(*event)) || eof)
        break;
    }
  } catch (const ParseError &e) {
    LOG_ERROR("Failed to parse ffmpeg output: {}", e.what());
    tx.send(ErrorEvent{e.what()});
  } catch (const std::system_error &e) {
    LOG_ERROR("Failed to read ffmpeg stderr: {}", e.what());
    tx.send(ErrorEvent{fmt::format("stderr read failed: {}", e.what())});
  } catch (const std::exception &e) {
    LOG_ERROR("Diagnostic parser failed: {}", e.what());
    tx.send(ErrorEvent{fmt::format("diagnostic parser failed: {}", e.what())});
  }
  LOG_DEBUG("Diagnostic parser stopped");
}

} // anonymous namespace

// **---- Lifetime ----**

EventStream::EventStream(FileHandle diagnostics, FileHandle binary,
                         FileHandle commands, std::function<void()> terminate)
    : EventStream(make_rendezvous_channel<Event>(), std::move(diagnostics),
                  std::move(binary), std::move(commands),
                  std::move(terminate)) {}

EventStream::EventStream(std::pair<Sender<Event>, Receiver<Event>> channel,
                         FileHandle diagnostics, FileHandle binary,
                         FileHandle commands, std::function<void()> terminate)
    : rx_(std::move(channel.second)), tx_(std::move(channel.first)),
      stdout_(std::move(binary)), stdin_(std::move(commands)),
      terminate_(std::move(terminate)) {
  workers_.emplace_back(
      [source = std::move(diagnostics), tx = *tx_]() mutable {
        run_parser(std::move(source), std::move(tx));
      });
}

EventStream::~EventStream() {
  rx_.close();
  if (!finished_)
    terminate();
  stdout_.reset();
  stdin_.reset();
  tx_.reset();
  for (auto &worker : workers_) {
    if (worker.joinable())
      worker.join();
  }
}

// **---- Sequence ----**

std::optional<Event> EventStream::next() {
  if (!pending_.empty()) {
    Event event = std::move(pending_.front());
    pending_.pop_front();
    return event;
  }
  if (finished_)
    return std::nullopt;

  auto event = rx_.recv();
  if (!event) {
    finished_ = true;
    return std::nullopt;
  }

  if (!metadata_.is_sealed()) {
    try {
      metadata_.handle_event(*event);
    } catch (const MetadataError &e) {
      LOG_ERROR("Inconsistent ffmpeg metadata: {}", e.what());
      pending_.emplace_back(ErrorEvent{e.what()});
    }

    if (metadata_.is_sealed()) {
      on_sealed();
    } else if (std::holds_alternative<LogEofEvent>(*event) ||
               std::holds_alternative<ErrorEvent>(*event)) {
      /// Before sealing only the parser sends, and these are its last words
      on_diagnostics_ended();
    }
  }

  return event;
}

void EventStream::on_sealed() {
  if (stdout_) {
    DemuxPlan plan =
        plan_demux(metadata_.output_streams(), metadata_.outputs());
    LOG_DEBUG("Metadata sealed, demux mode {} ({})",
              demux_mode_name(plan.mode), plan.reason);
    size_t chunk_size = Config::chunk_size();
    workers_.emplace_back([source = std::move(stdout_), plan = std::move(plan),
                           chunk_size, tx = *tx_]() mutable {
      Demuxer demuxer(std::move(source), std::move(plan), chunk_size);
      demuxer.run(tx);
    });
  } else {
    LOG_DEBUG("Metadata sealed, stdout not attached");
  }
  tx_.reset();
}

void EventStream::on_diagnostics_ended() {
  if (metadata_.expected_output_streams() > 0) {
    LOG_ERROR("ffmpeg output ended after {} of {} output stream(s) were "
              "described, terminating",
              metadata_.output_streams().size(),
              metadata_.expected_output_streams());
    terminate();
    pending_.emplace_back(ErrorEvent{fmt::format(
        "Fatal: metadata incomplete, {} of {} output stream(s) described",
        metadata_.output_streams().size(),
        metadata_.expected_output_streams())});
  }
  stdout_.reset();
  tx_.reset();
}

const Metadata &EventStream::collect_metadata() {
  std::string errors;
  while (!metadata_.is_sealed()) {
    auto event = next();
    if (!event) {
      throw std::runtime_error(fmt::format(
          "Event stream ended before metadata was complete{}{}",
          errors.empty() ? "" : ": ", errors));
    }
    if (auto message = error_message(*event)) {
      if (!errors.empty())
        errors += "; ";
      errors += *message;
    }
  }
  return metadata_;
}

// **---- Filters ----**

std::optional<std::string> EventStream::next_error() {
  while (auto event = next()) {
    if (auto message = error_message(*event))
      return message;
  }
  return std::nullopt;
}

std::optional<ProgressUpdate> EventStream::next_progress() {
  while (auto event = next()) {
    if (auto *progress = std::get_if<ProgressUpdate>(&*event))
      return std::move(*progress);
  }
  return std::nullopt;
}

std::optional<OutputFrame> EventStream::next_frame() {
  while (auto event = next()) {
    if (auto *frame = std::get_if<OutputFrame>(&*event))
      return std::move(*frame);
  }
  return std::nullopt;
}

std::optional<OutputChunk> EventStream::next_chunk() {
  while (auto event = next()) {
    if (auto *chunk = std::get_if<OutputChunk>(&*event))
      return std::move(*chunk);
  }
  return std::nullopt;
}

std::optional<std::string> EventStream::next_diagnostic_line() {
  while (auto event = next()) {
    if (auto line = raw_log_message(*event))
      return line;
  }
  return std::nullopt;
}

// **---- Control ----**

bool EventStream::request_shutdown() {
  if (!stdin_)
    return false;
  try {
    stdin_.write_all("q\n", 2);
  } catch (const std::system_error &e) {
    LOG_WARN("Failed to send quit command to ffmpeg: {}", e.what());
    return false;
  }
  return true;
}

void EventStream::terminate() {
  if (terminate_) {
    LOG_DEBUG("Terminating ffmpeg");
    terminate_();
  }
}

FileHandle EventStream::take_stdout() {
  if (metadata_.is_sealed())
    return FileHandle();
  return std::move(stdout_);
}

} // namespace ffstream
