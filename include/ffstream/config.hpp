/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *
 * @note Values are read once, on first use. Changing the environment after
 *       that has no effect for the rest of the process.
 */

#ifndef FFSTREAM_CONFIG_HPP
#define FFSTREAM_CONFIG_HPP

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <string>

namespace ffstream {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or not a whole number
 * @return Parsed integer value or default
 */
inline long get_env_long(const char *name, long default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  char *end = nullptr;
  errno = 0;
  long parsed = std::strtol(val, &end, 10);
  if (*end != '\0' || errno == ERANGE)
    return default_val;
  return parsed;
}

/**
 * @brief Get a positive size from environment variable.
 * @return default_val if unset, not a whole number, or not above zero
 * @note Never throws; the size accessors are first reached on worker
 *       threads.
 */
inline size_t get_env_size(const char *name, size_t default_val) {
  long parsed = get_env_long(name, 0);
  return parsed > 0 ? static_cast<size_t>(parsed) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

/// Path or bare name of the ffmpeg binary (resolved through PATH)
inline const std::string &ffmpeg_path() {
  static const std::string val = get_env_string("FFMPEG_PATH", "ffmpeg");
  return val;
}

/**
 * @brief Scratch buffer size for chunked demux mode.
 * @note Chunk boundaries carry no meaning; this only bounds how much is
 *       handed to the consumer per event.
 */
inline size_t chunk_size() {
  static size_t val = get_env_size("FFSTREAM_CHUNK_SIZE", 65536);
  return val;
}

/// Buffer size of the diagnostic line reader
inline size_t read_buffer_size() {
  static size_t val = get_env_size("FFSTREAM_READ_BUFFER", 8192);
  return val;
}

/// Enables LOG_DEBUG output
inline bool verbose() {
  static bool val = (get_env_long("FFSTREAM_VERBOSE", 0) != 0);
  return val;
}

/// CLI prints the timing summary at exit
inline bool timing() {
  static bool val = (get_env_long("FFSTREAM_TIMING", 0) != 0);
  return val;
}

} // namespace Config
} // namespace ffstream

#endif // FFSTREAM_CONFIG_HPP
