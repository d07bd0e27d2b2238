/**
 * @file line_reader.hpp
 * @brief Buffered line reader accepting "\n", "\r\n" and bare "\r"
 *
 * @details ffmpeg ends ordinary log lines with "\n" but rewrites its
 *          progress line in place with a bare "\r", so every one of the
 *          three common terminators closes a line. Runs of terminators
 *          between lines are skipped; empty lines are never returned.
 */

#ifndef FFSTREAM_LINE_READER_HPP
#define FFSTREAM_LINE_READER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "file_handle.hpp"

namespace ffstream {

/**
 * @class LineReader
 * @brief Splits a byte stream into lines without their terminators.
 */
class LineReader {
public:
  explicit LineReader(FileHandle source,
                      size_t buffer_size = Config::read_buffer_size());

  /**
   * @brief Read the next non-empty line.
   * @param line Output: the line bytes, terminator excluded
   * @return false at end of input (line is left empty)
   * @throws std::system_error on read failure
   */
  bool read_line(std::string &line);

private:
  /// Refill the buffer; false at end of input
  bool fill();

  FileHandle source_;
  std::vector<char> buf_;
  size_t pos_ = 0;
  size_t len_ = 0;
  bool eof_ = false;
};

/// Strict UTF-8 check (rejects overlongs, surrogates and > U+10FFFF)
bool is_valid_utf8(std::string_view text);

} // namespace ffstream

#endif // FFSTREAM_LINE_READER_HPP
