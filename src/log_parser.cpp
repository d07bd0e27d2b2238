/**
 * @file log_parser.cpp
 * @brief ffmpeg stderr line recognizers and the section-tracking parser
 *
 * @details Content rules are tried in a fixed priority order:
 *
 *          1. version  2. configuration  3. duration  4. stream mapping line
 *
 *          5. stream descriptor  6. progress  7. leveled log line
 */

#include "ffstream/log_parser.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <locale>
#include <sstream>

#include <fmt/core.h>

#include "ffstream/comma_iter.hpp"

namespace ffstream {

// **---- Internal Helpers ----**

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n";

std::string_view trim(std::string_view s) {
  size_t begin = s.find_first_not_of(WHITESPACE);
  if (begin == std::string_view::npos)
    return {};
  size_t end = s.find_last_not_of(WHITESPACE);
  return s.substr(begin, end - begin + 1);
}

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// First whitespace-delimited word (leading whitespace skipped)
std::string_view first_word(std::string_view s) {
  size_t begin = s.find_first_not_of(WHITESPACE);
  if (begin == std::string_view::npos)
    return {};
  size_t end = s.find_first_of(WHITESPACE, begin);
  return s.substr(begin, end == std::string_view::npos ? std::string_view::npos
                                                       : end - begin);
}

std::vector<std::string_view> split_whitespace(std::string_view s) {
  std::vector<std::string_view> words;
  while (true) {
    std::string_view word = first_word(s);
    if (word.empty())
      break;
    words.push_back(word);
    s.remove_prefix(static_cast<size_t>(word.data() - s.data()) + word.size());
  }
  return words;
}

/// Cut at the first ' ' or '(' ("rawvideo (RGB[24])" -> "rawvideo")
std::string_view cut_annotation(std::string_view s) {
  s = trim(s);
  size_t end = s.find_first_of(" (");
  return end == std::string_view::npos ? s : s.substr(0, end);
}

/// Always '.' as decimal point, whatever LC_NUMERIC the host has set
std::optional<double> parse_double(std::string_view s) {
  if (s.empty())
    return std::nullopt;
  std::istringstream in{std::string(s)};
  in.imbue(std::locale::classic());
  double val = 0.0;
  if (!(in >> val) || in.get() != std::char_traits<char>::eof())
    return std::nullopt;
  return val;
}

std::optional<float> parse_float(std::string_view s) {
  auto val = parse_double(s);
  if (!val)
    return std::nullopt;
  return static_cast<float>(*val);
}

std::optional<uint32_t> parse_uint(std::string_view s) {
  if (s.empty() || s.front() < '0' || s.front() > '9')
    return std::nullopt;
  std::string buf(s);
  char *end = nullptr;
  errno = 0;
  unsigned long val = std::strtoul(buf.c_str(), &end, 10);
  if (end != buf.c_str() + buf.size() || errno == ERANGE || val > UINT32_MAX)
    return std::nullopt;
  return static_cast<uint32_t>(val);
}

/// Line text the content rules look at: level tag removed, trimmed
std::string_view content_of(std::string_view line) {
  return trim(strip_level_prefix(line));
}

/// "Input #3, ..." / "Output #3, ..." -> 3
std::optional<uint32_t> parse_section_index(std::string_view rest) {
  std::string_view word = first_word(rest);
  size_t comma = word.find(',');
  if (comma != std::string_view::npos)
    word = word.substr(0, comma);
  return parse_uint(word);
}

/// Whitespace-delimited token following key, e.g. "fps=" in "fps= 25"
std::optional<std::string_view> value_after(std::string_view line,
                                            std::string_view key) {
  size_t pos = line.find(key);
  if (pos == std::string_view::npos)
    return std::nullopt;
  return first_word(line.substr(pos + key.size()));
}

std::string_view strip_suffix(std::string_view s, std::string_view suffix) {
  return ends_with(s, suffix) ? s.substr(0, s.size() - suffix.size()) : s;
}

bool is_not_available(std::string_view s) { return s == "N/A"; }

// **---- Stream type payloads ----**

std::optional<VideoInfo> parse_video_fields(CommaIter &fields) {
  VideoInfo video;

  auto pix = fields.next();
  if (!pix)
    return std::nullopt;
  /// "yuv444p(tv, progressive)" -> "yuv444p"
  video.pix_fmt = std::string(cut_annotation(*pix));

  auto dims_field = fields.next();
  if (!dims_field)
    return std::nullopt;
  std::string_view dims = first_word(*dims_field);
  size_t x = dims.find('x');
  if (x == std::string_view::npos)
    return std::nullopt;
  auto width = parse_uint(dims.substr(0, x));
  auto height = parse_uint(dims.substr(x + 1));
  if (!width || !height)
    return std::nullopt;
  video.width = *width;
  video.height = *height;

  /// fps is not necessarily the next field (SAR/DAR, bitrate, q=...)
  while (auto field = fields.next()) {
    std::string_view f = trim(*field);
    if (ends_with(f, " fps")) {
      video.fps = parse_float(first_word(f)).value_or(0.0f);
      break;
    }
  }

  return video;
}

std::optional<AudioInfo> parse_audio_fields(CommaIter &fields) {
  AudioInfo audio;

  auto rate_field = fields.next();
  if (!rate_field)
    return std::nullopt;
  auto words = split_whitespace(*rate_field);
  if (words.empty())
    return std::nullopt;
  auto rate = parse_uint(words[0]);
  if (!rate || (words.size() > 1 && words[1] != "Hz"))
    return std::nullopt;
  audio.sample_rate = *rate;

  auto layout = fields.next();
  if (!layout)
    return std::nullopt;
  audio.channels = std::string(trim(*layout));

  return audio;
}

} // anonymous namespace

// **---- Line recognizers ----**

std::string_view strip_level_prefix(std::string_view line) {
  static const std::array<std::string_view, 9> levels = {
      "info",  "warning", "error", "fatal", "panic",
      "quiet", "verbose", "debug", "trace"};

  if (line.empty() || line.front() != '[')
    return line;
  size_t close = line.find(']');
  if (close == std::string_view::npos)
    return line;
  std::string_view tag = line.substr(1, close - 1);
  for (std::string_view level : levels) {
    if (tag == level)
      return line.substr(close + 1);
  }
  return line;
}

LogLevel detect_log_level(std::string_view line) {
  if (line.find("[info]") != std::string_view::npos)
    return LogLevel::Info;
  if (line.find("[warning]") != std::string_view::npos)
    return LogLevel::Warning;
  if (line.find("[error]") != std::string_view::npos)
    return LogLevel::Error;
  if (line.find("[fatal]") != std::string_view::npos ||
      line.find("[panic]") != std::string_view::npos)
    return LogLevel::Fatal;
  return LogLevel::Unknown;
}

std::optional<std::string> try_parse_version(std::string_view line) {
  static const std::array<std::string_view, 3> tools = {"ffmpeg", "ffprobe",
                                                        "ffplay"};

  auto words = split_whitespace(content_of(line));
  if (words.size() < 3 || words[1] != "version")
    return std::nullopt;
  for (std::string_view tool : tools) {
    if (words[0] == tool)
      return std::string(words[2]);
  }
  return std::nullopt;
}

std::optional<std::vector<std::string>>
try_parse_configuration(std::string_view line) {
  std::string_view content = content_of(line);
  constexpr std::string_view prefix = "configuration:";
  if (!starts_with(content, prefix))
    return std::nullopt;

  std::vector<std::string> flags;
  for (std::string_view word : split_whitespace(content.substr(prefix.size())))
    flags.emplace_back(word);
  return flags;
}

std::optional<uint32_t> try_parse_input(std::string_view line) {
  std::string_view content = content_of(line);
  constexpr std::string_view prefix = "Input #";
  if (!starts_with(content, prefix))
    return std::nullopt;
  return parse_section_index(content.substr(prefix.size()));
}

std::optional<OutputDescriptor> try_parse_output(std::string_view line) {
  std::string_view content = content_of(line);
  constexpr std::string_view prefix = "Output #";
  if (!starts_with(content, prefix))
    return std::nullopt;
  content.remove_prefix(prefix.size());

  auto index = parse_section_index(content);
  if (!index)
    return std::nullopt;

  constexpr std::string_view marker = " to '";
  size_t to_pos = content.find(marker);
  if (to_pos == std::string_view::npos)
    return std::nullopt;
  std::string_view dest = content.substr(to_pos + marker.size());
  size_t quote = dest.find('\'');
  if (quote == std::string_view::npos)
    return std::nullopt;

  OutputDescriptor output;
  output.index = *index;
  output.to = std::string(dest.substr(0, quote));
  output.raw_log_message = std::string(line);
  return output;
}

std::optional<double> try_parse_duration(std::string_view line) {
  std::string_view content = content_of(line);
  constexpr std::string_view prefix = "Duration:";
  if (!starts_with(content, prefix))
    return std::nullopt;
  std::string_view value = content.substr(prefix.size());
  size_t comma = value.find(',');
  if (comma != std::string_view::npos)
    value = value.substr(0, comma);
  return parse_time_str(value);
}

std::optional<StreamDescriptor> try_parse_stream(std::string_view line) {
  std::string_view content = content_of(line);
  constexpr std::string_view prefix = "Stream #";
  if (!starts_with(content, prefix))
    return std::nullopt;

  CommaIter fields(content.substr(prefix.size()));
  auto head = fields.next();
  if (!head)
    return std::nullopt;

  /// "0:1[0x2](eng): Audio: opus" -> "0", "1[0x2](eng)", " Audio", " opus"
  std::string_view h = *head;
  size_t c1 = h.find(':');
  if (c1 == std::string_view::npos)
    return std::nullopt;
  size_t c2 = h.find(':', c1 + 1);
  if (c2 == std::string_view::npos)
    return std::nullopt;
  size_t c3 = h.find(':', c2 + 1);
  if (c3 == std::string_view::npos)
    return std::nullopt;

  StreamDescriptor stream;
  stream.raw_log_message = std::string(line);

  auto parent = parse_uint(trim(h.substr(0, c1)));
  if (!parent)
    return std::nullopt;
  stream.parent_index = *parent;

  /// Drop bracketed substream ids before reading index and language
  std::string index_and_lang;
  bool in_brackets = false;
  for (char ch : h.substr(c1 + 1, c2 - c1 - 1)) {
    if (ch == '[')
      in_brackets = true;
    else if (ch == ']')
      in_brackets = false;
    else if (!in_brackets)
      index_and_lang.push_back(ch);
  }
  std::string_view il = index_and_lang;
  size_t paren = il.find('(');
  auto index = parse_uint(trim(il.substr(0, paren)));
  if (!index)
    return std::nullopt;
  stream.stream_index = *index;
  if (paren != std::string_view::npos) {
    std::string_view lang = il.substr(paren + 1);
    size_t close = lang.find(')');
    stream.language = std::string(trim(lang.substr(0, close)));
  }

  std::string_view type = trim(h.substr(c2 + 1, c3 - c2 - 1));
  stream.format = std::string(cut_annotation(h.substr(c3 + 1)));

  if (type == "Video") {
    auto video = parse_video_fields(fields);
    if (!video)
      return std::nullopt;
    stream.type_data = std::move(*video);
  } else if (type == "Audio") {
    auto audio = parse_audio_fields(fields);
    if (!audio)
      return std::nullopt;
    stream.type_data = std::move(*audio);
  } else if (type == "Subtitle") {
    stream.type_data = SubtitleInfo{};
  } else {
    stream.type_data = OtherInfo{};
  }

  return stream;
}

std::optional<ProgressUpdate> try_parse_progress(std::string_view line) {
  std::string_view content = content_of(line);

  /// "size=" also matches "Lsize=" (final summary line)
  auto frame = value_after(content, "frame=");
  auto fps = value_after(content, "fps=");
  auto q = value_after(content, "q=");
  auto size = value_after(content, "size=");
  auto time = value_after(content, "time=");
  auto bitrate = value_after(content, "bitrate=");
  auto speed = value_after(content, "speed=");
  if (!frame || !fps || !q || !size || !time || !bitrate || !speed)
    return std::nullopt;

  ProgressUpdate progress;
  progress.raw_log_message = std::string(line);

  if (!is_not_available(*frame)) {
    auto v = parse_uint(*frame);
    if (!v)
      return std::nullopt;
    progress.frame = *v;
  }
  if (!is_not_available(*fps)) {
    auto v = parse_float(*fps);
    if (!v)
      return std::nullopt;
    progress.fps = *v;
  }
  if (!is_not_available(*q)) {
    auto v = parse_float(*q);
    if (!v)
      return std::nullopt;
    progress.q = *v;
  }
  if (!is_not_available(*size)) {
    /// "KiB" since ffmpeg 7.0, "kB" before
    std::string_view s = strip_suffix(strip_suffix(*size, "KiB"), "kB");
    auto v = parse_double(s);
    if (!v || *v < 0 || *v > static_cast<double>(UINT32_MAX))
      return std::nullopt;
    progress.size_kb = static_cast<uint32_t>(*v);
  }
  progress.time = std::string(*time);
  progress.bitrate_kbps =
      parse_float(strip_suffix(*bitrate, "kbits/s")).value_or(0.0f);
  progress.speed = parse_float(strip_suffix(*speed, "x")).value_or(0.0f);

  return progress;
}

std::optional<double> parse_time_str(std::string_view text) {
  text = trim(text);
  if (text.empty() || is_not_available(text))
    return std::nullopt;

  bool negative = false;
  if (text.front() == '-') {
    negative = true;
    text.remove_prefix(1);
  }

  /// Seconds, then minutes, then hours, reading from the right
  double seconds = 0.0;
  double scale = 1.0;
  int parts = 0;
  while (true) {
    size_t colon = text.rfind(':');
    std::string_view part =
        colon == std::string_view::npos ? text : text.substr(colon + 1);
    auto val = parse_double(part);
    if (!val || ++parts > 3)
      return std::nullopt;
    seconds += *val * scale;
    scale *= 60.0;
    if (colon == std::string_view::npos)
      break;
    text = text.substr(0, colon);
  }

  return negative ? -seconds : seconds;
}

// **---- LogParser ----**

LogParser::LogParser(FileHandle source) : reader_(std::move(source)) {}

std::optional<Event> LogParser::parse_next_event() {
  if (eof_reported_)
    return std::nullopt;

  std::string line;
  if (!reader_.read_line(line)) {
    eof_reported_ = true;
    return Event{LogEofEvent{}};
  }
  return parse_line(line);
}

Event LogParser::parse_line(const std::string &line) {
  if (!is_valid_utf8(line)) {
    throw ParseError("Diagnostic output is not valid UTF-8");
  }

  // **----- Section tracking -----**

  if (auto index = try_parse_input(line)) {
    section_ = Section::Input;
    section_index_ = *index;
    return InputDescriptor{*index, std::nullopt, line};
  }
  if (auto output = try_parse_output(line)) {
    section_ = Section::Output;
    section_index_ = output->index;
    return std::move(*output);
  }
  if (line.find("Stream mapping:") != std::string::npos) {
    section_ = Section::StreamMapping;
  }

  // **----- Content rules -----**

  if (auto version = try_parse_version(line)) {
    return VersionEvent{std::move(*version), line};
  }
  if (auto configuration = try_parse_configuration(line)) {
    return ConfigurationEvent{std::move(*configuration), line};
  }
  if (auto duration = try_parse_duration(line)) {
    if (section_ == Section::Input) {
      return InputDuration{section_index_, *duration, line};
    }
    return LogEvent{LogLevel::Info, line};
  }
  if (section_ == Section::StreamMapping &&
      strip_level_prefix(line).find("  Stream #") != std::string_view::npos) {
    return StreamMappingEvent{line};
  }
  if (auto stream = try_parse_stream(line)) {
    switch (section_) {
    case Section::Input:
      return InputStreamEvent{std::move(*stream)};
    case Section::Output:
      return OutputStreamEvent{std::move(*stream)};
    case Section::Other:
    case Section::StreamMapping:
      break;
    }
    throw ParseError(fmt::format("Unexpected stream specification: {}", line));
  }
  if (auto progress = try_parse_progress(line)) {
    section_ = Section::Other;
    return std::move(*progress);
  }

  return LogEvent{detect_log_level(line), line};
}

} // namespace ffstream
