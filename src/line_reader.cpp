/**
 * @file line_reader.cpp
 * @brief LineReader and UTF-8 validation implementation
 */

#include "ffstream/line_reader.hpp"

#include <algorithm>

namespace ffstream {

namespace {

inline bool is_line_end(char c) { return c == '\n' || c == '\r'; }

} // anonymous namespace

LineReader::LineReader(FileHandle source, size_t buffer_size)
    : source_(std::move(source)), buf_(std::max<size_t>(buffer_size, 64)) {}

bool LineReader::fill() {
  if (eof_)
    return false;
  len_ = source_.read_some(reinterpret_cast<uint8_t *>(buf_.data()),
                           buf_.size());
  pos_ = 0;
  if (len_ == 0) {
    eof_ = true;
    return false;
  }
  return true;
}

bool LineReader::read_line(std::string &line) {
  line.clear();

  /// Skip terminators left over from the previous line ("\r\n", blank lines)
  for (;;) {
    if (pos_ == len_ && !fill())
      return false;
    if (!is_line_end(buf_[pos_]))
      break;
    ++pos_;
  }

  for (;;) {
    const char *begin = buf_.data() + pos_;
    const char *end = buf_.data() + len_;
    const char *hit = std::find_if(begin, end, is_line_end);
    line.append(begin, hit);
    if (hit != end) {
      pos_ = static_cast<size_t>(hit - buf_.data()) + 1;
      return true;
    }
    pos_ = len_;
    if (!fill())
      return true; /// Last line without terminator
  }
}

bool is_valid_utf8(std::string_view text) {
  size_t i = 0;
  const size_t n = text.size();
  while (i < n) {
    auto c = static_cast<unsigned char>(text[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t extra;
    uint32_t cp;
    if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }

    for (size_t k = 1; k <= extra; ++k) {
      if (i + k >= n)
        return false;
      auto cc = static_cast<unsigned char>(text[i + k]);
      if ((cc & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3F);
    }

    /// Overlong encodings, surrogates, out of range
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
        (extra == 3 && cp < 0x10000) || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF))
      return false;

    i += extra + 1;
  }
  return true;
}

} // namespace ffstream
