/**
 * @file channel.hpp
 * @brief Zero-capacity (rendezvous) channel between workers and consumer
 *
 * @details A send completes only once the receiver has taken the value, so
 *          at most one event is ever in flight. A stalled consumer therefore
 *          stalls the workers, which stops them draining ffmpeg's pipes,
 *          which in turn blocks ffmpeg itself.
 *
 * @attention USAGE:
 *
 *   - Workers hold copies of Sender and call send() in a loop
 *
 *   - The consumer calls recv() until it returns nullopt (every Sender gone)
 *
 *   - Dropping the Receiver makes every pending and future send() fail
 */

#ifndef FFSTREAM_CHANNEL_HPP
#define FFSTREAM_CHANNEL_HPP

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace ffstream {

namespace detail {

template <typename T> struct ChannelState {
  std::mutex mutex;
  std::condition_variable cv;
  std::optional<T> slot;
  uint64_t sent = 0;     //< Tickets handed out to values placed in the slot
  uint64_t received = 0; //< Tickets taken by the receiver
  size_t senders = 0;
  bool receiver_closed = false;
};

} // namespace detail

template <typename T> class Receiver;

/**
 * @class Sender
 * @brief Sending side; copies share the channel.
 */
template <typename T> class Sender {
public:
  explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->senders;
  }

  Sender(const Sender &other) : state_(other.state_) {
    if (state_) {
      std::lock_guard<std::mutex> lock(state_->mutex);
      ++state_->senders;
    }
  }

  Sender(Sender &&other) noexcept : state_(std::move(other.state_)) {}

  Sender &operator=(const Sender &) = delete;
  Sender &operator=(Sender &&) = delete;

  ~Sender() {
    if (!state_)
      return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    --state_->senders;
    state_->cv.notify_all();
  }

  /**
   * @brief Hand value to the receiver, blocking until it is taken.
   * @return false if the receiver is gone (value dropped)
   */
  bool send(T value) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] {
      return !state_->slot.has_value() || state_->receiver_closed;
    });
    if (state_->receiver_closed)
      return false;

    state_->slot.emplace(std::move(value));
    uint64_t ticket = ++state_->sent;
    state_->cv.notify_all();

    state_->cv.wait(lock, [this, ticket] {
      return state_->received >= ticket || state_->receiver_closed;
    });
    if (state_->received >= ticket)
      return true;

    state_->slot.reset();
    return false;
  }

private:
  std::shared_ptr<detail::ChannelState<T>> state_;
};

/**
 * @class Receiver
 * @brief Receiving side; move-only.
 */
template <typename T> class Receiver {
public:
  explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {}

  /// Disable copy
  Receiver(const Receiver &) = delete;
  Receiver &operator=(const Receiver &) = delete;

  /// Enable move
  Receiver(Receiver &&other) noexcept = default;
  Receiver &operator=(Receiver &&other) noexcept {
    if (this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~Receiver() { close(); }

  /**
   * @brief Take the next value (blocking).
   * @return nullopt once every Sender is gone and the slot is empty, or
   *         after close()
   */
  std::optional<T> recv() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] {
      return state_->slot.has_value() || state_->senders == 0 ||
             state_->receiver_closed;
    });
    if (state_->receiver_closed || !state_->slot.has_value())
      return std::nullopt;

    std::optional<T> value(std::move(state_->slot));
    state_->slot.reset();
    ++state_->received;
    state_->cv.notify_all();
    return value;
  }

  /// Refuse further values; blocked senders return false
  void close() {
    if (!state_)
      return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->receiver_closed = true;
    state_->slot.reset();
    state_->cv.notify_all();
  }

private:
  std::shared_ptr<detail::ChannelState<T>> state_;
};

/// Create a connected {Sender, Receiver} pair
template <typename T>
std::pair<Sender<T>, Receiver<T>> make_rendezvous_channel() {
  auto state = std::make_shared<detail::ChannelState<T>>();
  return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace ffstream

#endif // FFSTREAM_CHANNEL_HPP
