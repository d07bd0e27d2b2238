/**
 * @file event_stream.hpp
 * @brief Merges ffmpeg's stderr and stdout into one ordered event sequence
 *
 * @details Pipeline:
 *
 *          stderr -> [parser thread] --+
 *                                      +--> rendezvous channel --> next()
 *          stdout -> [demuxer thread] -+          (metadata folded inline)
 *
 *          The demuxer thread only starts once the metadata seals, because
 *          the frame layout is unknown until then.
 *
 * @attention The consumer drives everything: if it stops calling next(),
 *            both workers block on send and ffmpeg blocks on its pipes.
 */

#ifndef FFSTREAM_EVENT_STREAM_HPP
#define FFSTREAM_EVENT_STREAM_HPP

#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "channel.hpp"
#include "event.hpp"
#include "file_handle.hpp"
#include "metadata.hpp"

namespace ffstream {

/**
 * @class EventStream
 * @brief Pull-based event sequence over a running ffmpeg process.
 *
 * @note Not copyable or movable: worker threads are bound to it. It is
 *       still returned by value from factories (guaranteed elision).
 */
class EventStream {
public:
  /**
   * @param diagnostics ffmpeg's stderr (read end)
   * @param binary ffmpeg's stdout (read end), may be empty
   * @param commands ffmpeg's stdin (write end), may be empty
   * @param terminate Forcibly stops the child, may be empty
   */
  explicit EventStream(FileHandle diagnostics, FileHandle binary = {},
                       FileHandle commands = {},
                       std::function<void()> terminate = {});

  /**
   * @brief Close the channel and join the workers.
   * @note If the sequence was not drained, the child is terminated first so
   *       that the workers' blocking reads return.
   */
  ~EventStream();

  /// Disable copy and move
  EventStream(const EventStream &) = delete;
  EventStream &operator=(const EventStream &) = delete;
  EventStream(EventStream &&) = delete;
  EventStream &operator=(EventStream &&) = delete;

  /**
   * @brief Next event (blocking).
   * @return nullopt once every worker has finished
   */
  std::optional<Event> next();

  /**
   * @class iterator
   * @brief Input iterator over next(), for range-for loops.
   */
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Event;
    using difference_type = std::ptrdiff_t;
    using pointer = Event *;
    using reference = Event &;

    iterator() = default;
    explicit iterator(EventStream *stream) : stream_(stream) { advance(); }

    reference operator*() { return *current_; }
    pointer operator->() { return &*current_; }
    iterator &operator++() {
      advance();
      return *this;
    }

    bool operator==(const iterator &other) const {
      return current_.has_value() == other.current_.has_value();
    }
    bool operator!=(const iterator &other) const { return !(*this == other); }

  private:
    void advance() { current_ = stream_->next(); }

    EventStream *stream_ = nullptr;
    std::optional<Event> current_;
  };

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

  /**
   * @brief Pull events until the metadata seals.
   * @return The sealed metadata
   * @throws std::runtime_error with the error texts seen on the way if the
   *         sequence ends first
   * @note Events pulled here are consumed, not replayed.
   */
  const Metadata &collect_metadata();

  // **---- Filters over next() ----**

  /// Next ErrorEvent text or error/fatal log line
  std::optional<std::string> next_error();
  std::optional<ProgressUpdate> next_progress();
  std::optional<OutputFrame> next_frame();
  std::optional<OutputChunk> next_chunk();
  /// Next original diagnostic line, whatever event carried it
  std::optional<std::string> next_diagnostic_line();

  // **---- Control ----**

  /**
   * @brief Ask ffmpeg to stop cleanly by writing "q\n" to its stdin.
   * @return false if there is no command handle or the write failed
   */
  bool request_shutdown();

  /// Invoke the terminate callback (no-op without one)
  void terminate();

  /**
   * @brief Take ownership of ffmpeg's stdout and disable the demuxer.
   * @return Empty handle once the demuxer has started (or was never given)
   */
  FileHandle take_stdout();

  const Metadata &metadata() const { return metadata_; }

private:
  EventStream(std::pair<Sender<Event>, Receiver<Event>> channel,
              FileHandle diagnostics, FileHandle binary, FileHandle commands,
              std::function<void()> terminate);

  void on_sealed();
  void on_diagnostics_ended();

  Receiver<Event> rx_;
  std::optional<Sender<Event>> tx_; //< Held until the demuxer decision
  FileHandle stdout_;
  FileHandle stdin_;
  std::function<void()> terminate_;
  Metadata metadata_;
  std::deque<Event> pending_; //< Synthesized events queued after the current
  std::vector<std::thread> workers_;
  bool finished_ = false;
};

} // namespace ffstream

#endif // FFSTREAM_EVENT_STREAM_HPP
