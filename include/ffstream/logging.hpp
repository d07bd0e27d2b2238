/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Runtime-gated LOG_DEBUG (FFSTREAM_VERBOSE=1)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating phase timings
 *
 * @note All logs use fmt::print for type-safe formatting and go to stderr,
 *       flushed immediately. Stdout is left to the caller, which may be
 *       forwarding payload bytes.
 */

#ifndef FFSTREAM_LOGGING_HPP
#define FFSTREAM_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "config.hpp"

namespace ffstream {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(ffstream::log_mutex);                     \
    fmt::print(stderr, "[INFO] " format_str "\n", ##__VA_ARGS__);              \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(ffstream::log_mutex);                     \
    fmt::print(stderr, fg(fmt::color::yellow), "[WARN] " format_str "\n",      \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(ffstream::log_mutex);                     \
    fmt::print(stderr, fg(fmt::color::red), "[ERROR] " format_str "\n",        \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(ffstream::log_mutex);                     \
    fmt::print(stderr, fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);  \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(ffstream::log_mutex);                     \
    fmt::print(stderr, fg(fmt::color::green), format_str "\n", ##__VA_ARGS__); \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (ffstream::Config::verbose()) {                                         \
      std::lock_guard<std::mutex> lock(ffstream::log_mutex);                   \
      fmt::print(stderr, fg(fmt::color::gray), "[DEBUG] " format_str "\n",     \
                 ##__VA_ARGS__);                                               \
      std::fflush(stderr);                                                     \
    }                                                                          \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#define LOG_DEBUG(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 * @note Stores the phase name and duration in microseconds.
 */
struct TimingEntry {
  std::string name;  //< Function or phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe singleton for collecting timing measurements.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Function or phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table.
   */
  static void print_summary();

  /**
   * @brief Sum of every measurement recorded under name.
   * @return Microseconds, 0 if nothing was recorded
   */
  static long total(const std::string &name);
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    ffstream::TimingCollector::record(#name, timer_duration_##name);           \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace ffstream

#endif // FFSTREAM_LOGGING_HPP
