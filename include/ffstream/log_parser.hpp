/**
 * @file log_parser.hpp
 * @brief Section-aware parser for ffmpeg's stderr log
 *
 * @details LogParser turns the diagnostic text ffmpeg writes on stderr into
 *          one Event per line. It tracks which part of the preamble it is in
 *          (an input section, an output section, the stream mapping block)
 *          because the same "Stream #..." line means an input stream, an
 *          output stream or a mapping depending on where it appears.
 *
 *          The try_parse_* functions are the individual line recognizers.
 *          They accept a line with or without the "[level]" prefix that
 *          "-loglevel level+info" adds.
 *
 * @note Expected preamble shape (with level prefixes):
 *
 *       [info] Input #0, lavfi, from 'testsrc=duration=10':
 *
 *       [info]   Duration: N/A, start: 0.000000, bitrate: N/A
 *
 *       [info]   Stream #0:0: Video: wrapped_avframe, rgb24, 320x240, 25 fps
 *
 *       [info] Stream mapping:
 *
 *       [info]   Stream #0:0 -> #0:0 (wrapped_avframe (native) -> rawvideo)
 *
 *       [info] Output #0, rawvideo, to 'pipe:':
 *
 *       [info]   Stream #0:0: Video: rawvideo, rgb24, 320x240, 25 fps
 */

#ifndef FFSTREAM_LOG_PARSER_HPP
#define FFSTREAM_LOG_PARSER_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "event.hpp"
#include "file_handle.hpp"
#include "line_reader.hpp"

namespace ffstream {

/**
 * @class ParseError
 * @brief A line that cannot be interpreted in the current section, or bytes
 *        that are not valid UTF-8.
 */
class ParseError : public std::runtime_error {
public:
  explicit ParseError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @class LogParser
 * @brief Reads ffmpeg stderr and produces one Event per line.
 *
 * @attention SECTION TRACKING (checked before content rules):
 *
 * - "Input #N, ..."            -> within input N (emits InputDescriptor)
 *
 * - "Output #N, ..., to '...'" -> within output N (emits OutputDescriptor)
 *
 * - "... Stream mapping: ..."  -> within the stream mapping block
 *
 * - a progress line            -> back to "other"
 */
class LogParser {
public:
  explicit LogParser(FileHandle source);

  /**
   * @brief Consume one line and return its event.
   * @return The event; LogEofEvent exactly once at end of input; nullopt on
   *         every call after that.
   * @throws ParseError on a stream descriptor outside any input/output, or
   *         on invalid UTF-8
   * @throws std::system_error on read failure
   */
  std::optional<Event> parse_next_event();

private:
  enum class Section { Other, Input, Output, StreamMapping };

  Event parse_line(const std::string &line);

  LineReader reader_;
  Section section_ = Section::Other;
  uint32_t section_index_ = 0; //< Input/output number for those sections
  bool eof_reported_ = false;
};

// **---- Line recognizers ----**

/// "ffmpeg version <token> ..." -> token
std::optional<std::string> try_parse_version(std::string_view line);

/// "configuration: --a --b" -> {"--a", "--b"}
std::optional<std::vector<std::string>>
try_parse_configuration(std::string_view line);

/// "Input #N, fmt, from 'src':" -> N
std::optional<uint32_t> try_parse_input(std::string_view line);

/// "Output #N, fmt, to 'dest':" -> {N, dest, line}
std::optional<OutputDescriptor> try_parse_output(std::string_view line);

/// "Duration: 00:00:05.00, start: ..." -> seconds; nullopt for "N/A"
std::optional<double> try_parse_duration(std::string_view line);

/// "Stream #P:I[sub](lang): Type: fields..." -> descriptor
std::optional<StreamDescriptor> try_parse_stream(std::string_view line);

/// "frame= ... fps= ... q= ... size= ... time= ... bitrate= ... speed= ..."
std::optional<ProgressUpdate> try_parse_progress(std::string_view line);

/**
 * @brief Parse "H:MM:SS.frac", "M:SS.frac" or plain seconds.
 * @return Seconds, nullopt for "N/A" or malformed text
 */
std::optional<double> parse_time_str(std::string_view text);

/// Level from an embedded "[info]"/"[warning]"/"[error]"/"[fatal]" marker
LogLevel detect_log_level(std::string_view line);

/// Remove one leading "[level]" tag; the rest of the line is untouched
std::string_view strip_level_prefix(std::string_view line);

} // namespace ffstream

#endif // FFSTREAM_LOG_PARSER_HPP
