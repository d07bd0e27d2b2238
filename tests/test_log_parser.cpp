#include <gtest/gtest.h>

#include <clocale>

#include "ffstream/log_parser.hpp"
#include "test_helpers.hpp"

using namespace ffstream;
using ffstream::test::lines;
using ffstream::test::pipe_from_string;

namespace {

std::vector<Event> parse_all(const std::string &text) {
  LogParser parser(pipe_from_string(text));
  std::vector<Event> events;
  while (auto event = parser.parse_next_event())
    events.push_back(std::move(*event));
  return events;
}

} // anonymous namespace

// **---- Time ----**

TEST(ParseTimeTest, HoursMinutesSeconds) {
  auto t = parse_time_str("00:01:19.72");
  ASSERT_TRUE(t.has_value());
  EXPECT_NEAR(*t, 79.72, 1e-9);
  EXPECT_NEAR(*parse_time_str("1:00:00.5"), 3600.5, 1e-9);
}

TEST(ParseTimeTest, MinutesSecondsAndBareSeconds) {
  EXPECT_NEAR(*parse_time_str("1:02.5"), 62.5, 1e-9);
  EXPECT_NEAR(*parse_time_str("12.25"), 12.25, 1e-9);
  EXPECT_NEAR(*parse_time_str(" 5 "), 5.0, 1e-9);
}

TEST(ParseTimeTest, NotAvailableAndGarbage) {
  EXPECT_FALSE(parse_time_str("N/A").has_value());
  EXPECT_FALSE(parse_time_str("").has_value());
  EXPECT_FALSE(parse_time_str("a:b").has_value());
  EXPECT_FALSE(parse_time_str("1:2:3:4").has_value());
}

// **---- Recognizers ----**

TEST(LogLineTest, Version) {
  auto v = try_parse_version("[info] ffmpeg version 7.0.1-full_build-www.gyan.dev "
                             "Copyright (c) 2000-2024 the FFmpeg developers");
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(*v, "7.0.1-full_build-www.gyan.dev");

  EXPECT_EQ(*try_parse_version("ffmpeg version n6.1 Copyright"), "n6.1");
  EXPECT_FALSE(try_parse_version("[info]   built with gcc 13").has_value());
  EXPECT_FALSE(try_parse_version("ffmpeg version").has_value());
}

TEST(LogLineTest, Configuration) {
  auto c = try_parse_configuration(
      "[info]   configuration: --enable-gpl --enable-libx264 --enable-nonfree");
  ASSERT_TRUE(c.has_value());
  ASSERT_EQ(c->size(), 3u);
  EXPECT_EQ((*c)[0], "--enable-gpl");
  EXPECT_EQ((*c)[2], "--enable-nonfree");
}

TEST(LogLineTest, InputAndOutput) {
  EXPECT_EQ(*try_parse_input("[info] Input #0, lavfi, from 'testsrc':"), 0u);
  EXPECT_EQ(*try_parse_input("Input #12, mov,mp4, from 'a.mp4':"), 12u);
  EXPECT_FALSE(try_parse_input("[info] Inputs are ready").has_value());

  std::string line = "[info] Output #1, rawvideo, to 'pipe:':";
  auto out = try_parse_output(line);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->index, 1u);
  EXPECT_EQ(out->to, "pipe:");
  EXPECT_EQ(out->raw_log_message, line);
  EXPECT_TRUE(out->is_stdout());

  auto file = try_parse_output("Output #0, mp4, to 'out/video file.mp4':");
  ASSERT_TRUE(file.has_value());
  EXPECT_EQ(file->to, "out/video file.mp4");
  EXPECT_FALSE(file->is_stdout());
}

TEST(LogLineTest, StdoutAliasesAreExact) {
  for (const char *alias : {"pipe", "pipe:", "pipe:1", "-"}) {
    OutputDescriptor out;
    out.to = alias;
    EXPECT_TRUE(out.is_stdout()) << alias;
  }
  for (const char *other : {"pipe:2", "pipe.mp4", "--", "out.raw"}) {
    OutputDescriptor out;
    out.to = other;
    EXPECT_FALSE(out.is_stdout()) << other;
  }
}

TEST(LogLineTest, Duration) {
  auto d = try_parse_duration(
      "[info]   Duration: 00:00:05.00, start: 0.000000, bitrate: N/A");
  ASSERT_TRUE(d.has_value());
  EXPECT_NEAR(*d, 5.0, 1e-9);
  EXPECT_FALSE(
      try_parse_duration("  Duration: N/A, start: 0.000000, bitrate: N/A")
          .has_value());
}

TEST(LogLineTest, VideoStreamWithSarAndTbr) {
  auto s = try_parse_stream("Stream #0:0: Video: wrapped_avframe, rgb24, "
                            "320x240 [SAR 1:1 DAR 4:3], 25 fps, 25 tbr, 25 tbn");
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->format, "wrapped_avframe");
  EXPECT_EQ(s->parent_index, 0u);
  EXPECT_EQ(s->stream_index, 0u);
  EXPECT_TRUE(s->language.empty());
  ASSERT_TRUE(s->is_video());
  EXPECT_EQ(s->video()->pix_fmt, "rgb24");
  EXPECT_EQ(s->video()->width, 320u);
  EXPECT_EQ(s->video()->height, 240u);
  EXPECT_FLOAT_EQ(s->video()->fps, 25.0f);
}

TEST(LogLineTest, VideoStreamWithAnnotatedPixelFormat) {
  auto s = try_parse_stream(
      "[info]   Stream #0:0(und): Video: h264 (High 4:4:4 Predictive) "
      "(avc1 / 0x31637661), yuv444p(tv, progressive), 320x240 [SAR 1:1 DAR "
      "4:3], 8 kb/s, 29.97 fps, 29.97 tbr, 12800 tbn (default)");
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->format, "h264");
  EXPECT_EQ(s->language, "und");
  EXPECT_EQ(s->video()->pix_fmt, "yuv444p");
  EXPECT_EQ(s->video()->width, 320u);
  EXPECT_NEAR(s->video()->fps, 29.97f, 1e-4);
}

TEST(LogLineTest, VideoStreamWithoutFps) {
  auto s = try_parse_stream(
      "Stream #1:0: Video: rawvideo (RGB[24] / 0x18424752), rgb24, 64x48, "
      "q=2-31, 200 kb/s");
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->parent_index, 1u);
  EXPECT_EQ(s->format, "rawvideo");
  EXPECT_FLOAT_EQ(s->video()->fps, 0.0f);
}

TEST(LogLineTest, AudioStreamWithSubstreamAndLanguage) {
  auto s = try_parse_stream(
      "[info]   Stream #0:1[0x2](eng): Audio: opus, 48000 Hz, stereo, fltp");
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->parent_index, 0u);
  EXPECT_EQ(s->stream_index, 1u);
  EXPECT_EQ(s->language, "eng");
  EXPECT_EQ(s->format, "opus");
  ASSERT_TRUE(s->is_audio());
  EXPECT_EQ(s->audio()->sample_rate, 48000u);
  EXPECT_EQ(s->audio()->channels, "stereo");
}

TEST(LogLineTest, SubstreamWithoutLanguage) {
  auto s = try_parse_stream("Stream #0:3[0x1e0]: Audio: aac (LC), 44100 Hz, "
                            "5.1, fltp, 384 kb/s");
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->stream_index, 3u);
  EXPECT_TRUE(s->language.empty());
  EXPECT_EQ(s->format, "aac");
  EXPECT_EQ(s->audio()->channels, "5.1");
}

TEST(LogLineTest, SubtitleAndDataStreams) {
  auto sub = try_parse_stream("Stream #0:2(eng): Subtitle: subrip");
  ASSERT_TRUE(sub.has_value());
  EXPECT_TRUE(sub->is_subtitle());
  EXPECT_EQ(sub->format, "subrip");

  auto data = try_parse_stream("Stream #0:3: Data: bin_data (text / 0x74786574)");
  ASSERT_TRUE(data.has_value());
  EXPECT_TRUE(data->is_other());
  EXPECT_EQ(data->format, "bin_data");
}

TEST(LogLineTest, MalformedStreamIsNotAStream) {
  EXPECT_FALSE(try_parse_stream("Stream #0:0: Video: rawvideo").has_value());
  EXPECT_FALSE(
      try_parse_stream("Stream #0:0: Video: rawvideo, rgb24, big").has_value());
  EXPECT_FALSE(try_parse_stream("Stream #x:0: Audio: aac, 1 Hz, mono")
                   .has_value());
}

TEST(LogLineTest, ProgressLine) {
  std::string line = "frame= 1996 fps=1984 q=-1.0 Lsize=     372kB "
                     "time=00:01:19.72 bitrate=  38.2kbits/s speed=79.2x";
  auto p = try_parse_progress(line);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->frame, 1996u);
  EXPECT_FLOAT_EQ(p->fps, 1984.0f);
  EXPECT_FLOAT_EQ(p->q, -1.0f);
  EXPECT_EQ(p->size_kb, 372u);
  EXPECT_EQ(p->time, "00:01:19.72");
  EXPECT_NEAR(p->bitrate_kbps, 38.2f, 1e-4);
  EXPECT_NEAR(p->speed, 79.2f, 1e-4);
  EXPECT_EQ(p->raw_log_message, line);
}

TEST(LogLineTest, ProgressLineKibibytes) {
  auto p = try_parse_progress("[info] frame=   25 fps=0.0 q=-0.0 size=     "
                              "256KiB time=00:00:01.00 bitrate=2097.2kbits/s "
                              "speed=1.91x");
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->frame, 25u);
  EXPECT_EQ(p->size_kb, 256u);
  EXPECT_NEAR(p->speed, 1.91f, 1e-4);
}

TEST(LogLineTest, ProgressLineNotAvailable) {
  auto p = try_parse_progress("frame=    0 fps=0.0 q=0.0 size=       0kB "
                              "time=N/A bitrate=N/A speed=N/A");
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->frame, 0u);
  EXPECT_EQ(p->time, "N/A");
  EXPECT_FLOAT_EQ(p->bitrate_kbps, 0.0f);
  EXPECT_FLOAT_EQ(p->speed, 0.0f);
}

TEST(LogLineTest, ProgressSizeBeyondRangeIsRejected) {
  EXPECT_FALSE(try_parse_progress("frame= 10 fps=5 q=1 Lsize=99999999999kB "
                                  "time=00:00:01.00 bitrate=1kbits/s speed=1x")
                   .has_value());
  auto p = try_parse_progress("frame= 10 fps=5 q=1 Lsize=4294967295kB "
                              "time=00:00:01.00 bitrate=1kbits/s speed=1x");
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->size_kb, 4294967295u);
}

TEST(LogLineTest, NumbersIgnoreHostLocale) {
  const char *previous = std::setlocale(LC_NUMERIC, nullptr);
  std::string saved = previous ? previous : "C";
  if (!std::setlocale(LC_NUMERIC, "de_DE.UTF-8") &&
      !std::setlocale(LC_NUMERIC, "fr_FR.UTF-8")) {
    GTEST_SKIP() << "no comma-decimal locale installed";
  }

  auto s = try_parse_stream(
      "Stream #0:0: Video: rawvideo, rgb24, 4x2, 29.97 fps, 29.97 tbr");
  auto p = try_parse_progress("frame= 10 fps=2.5 q=-1.0 size=1kB "
                              "time=00:00:01.00 bitrate=38.2kbits/s speed=1.5x");
  std::setlocale(LC_NUMERIC, saved.c_str());

  ASSERT_TRUE(s.has_value());
  EXPECT_NEAR(s->video()->fps, 29.97f, 1e-4);
  ASSERT_TRUE(p.has_value());
  EXPECT_FLOAT_EQ(p->fps, 2.5f);
  EXPECT_NEAR(p->bitrate_kbps, 38.2f, 1e-4);
  EXPECT_FLOAT_EQ(p->speed, 1.5f);
}

TEST(LogLineTest, ProgressNeedsEveryKey) {
  EXPECT_FALSE(try_parse_progress("frame= 10 fps=5 q=1 time=00:00:01.00 "
                                  "bitrate=1kbits/s speed=1x")
                   .has_value());
}

TEST(LogLineTest, LevelDetection) {
  EXPECT_EQ(detect_log_level("[info] hello"), LogLevel::Info);
  EXPECT_EQ(detect_log_level("[warning] careful"), LogLevel::Warning);
  EXPECT_EQ(detect_log_level("[vost#0:0 @ 0x5581] [error] broken"),
            LogLevel::Error);
  EXPECT_EQ(detect_log_level("[fatal] dead"), LogLevel::Fatal);
  EXPECT_EQ(detect_log_level("no marker"), LogLevel::Unknown);
}

TEST(LogLineTest, StripLevelPrefix) {
  EXPECT_EQ(strip_level_prefix("[info]   Duration: 1"), "   Duration: 1");
  EXPECT_EQ(strip_level_prefix("[out#0/rawvideo @ 0x1] x"),
            "[out#0/rawvideo @ 0x1] x");
  EXPECT_EQ(strip_level_prefix("plain"), "plain");
}

// **---- LogParser ----**

TEST(LogParserTest, FullPreambleSequence) {
  auto events = parse_all(
      lines({"[info] ffmpeg version 6.1 Copyright (c) 2000-2023 the FFmpeg "
             "developers",
             "[info]   configuration: --enable-gpl",
             "[info] Input #0, lavfi, from 'testsrc=duration=1':",
             "[info]   Duration: 00:00:01.00, start: 0.000000, bitrate: N/A",
             "[info]   Stream #0:0: Video: wrapped_avframe, rgb24, 320x240 "
             "[SAR 1:1 DAR 4:3], 25 fps, 25 tbr, 25 tbn",
             "[info] Stream mapping:",
             "[info]   Stream #0:0 -> #0:0 (wrapped_avframe (native) -> "
             "rawvideo (native))",
             "[info] Output #0, rawvideo, to 'pipe:':",
             "[info]   Stream #0:0: Video: rawvideo (RGB[24] / 0x18424752), "
             "rgb24(progressive), 320x240 [SAR 1:1 DAR 4:3], q=2-31, 46080 "
             "kb/s, 25 fps, 25 tbn"}) +
      "[info] frame=   25 fps=0.0 q=-0.0 Lsize=    5625KiB time=00:00:01.00 "
      "bitrate=46080.0kbits/s speed=20.1x\r[warning] something odd\n");

  ASSERT_EQ(events.size(), 12u);
  EXPECT_EQ(std::get<VersionEvent>(events[0]).version, "6.1");
  EXPECT_EQ(std::get<ConfigurationEvent>(events[1]).configuration.size(), 1u);
  EXPECT_EQ(std::get<InputDescriptor>(events[2]).index, 0u);
  EXPECT_EQ(std::get<InputDuration>(events[3]).input_index, 0u);
  EXPECT_NEAR(std::get<InputDuration>(events[3]).duration, 1.0, 1e-9);
  EXPECT_EQ(std::get<InputStreamEvent>(events[4]).stream.format,
            "wrapped_avframe");
  EXPECT_EQ(std::get<LogEvent>(events[5]).level, LogLevel::Info);
  EXPECT_TRUE(std::holds_alternative<StreamMappingEvent>(events[6]));
  EXPECT_EQ(std::get<OutputDescriptor>(events[7]).to, "pipe:");

  const auto &out = std::get<OutputStreamEvent>(events[8]).stream;
  EXPECT_EQ(out.format, "rawvideo");
  EXPECT_EQ(out.video()->pix_fmt, "rgb24");
  EXPECT_FLOAT_EQ(out.video()->fps, 25.0f);

  EXPECT_EQ(std::get<ProgressUpdate>(events[9]).size_kb, 5625u);
  EXPECT_EQ(std::get<LogEvent>(events[10]).level, LogLevel::Warning);
  EXPECT_TRUE(std::holds_alternative<LogEofEvent>(events[11]));
}

TEST(LogParserTest, RawTextRoundTrips) {
  std::vector<std::string> input = {
      "[info] Input #0, lavfi, from 'testsrc':",
      "[info]   Duration: N/A, start: 0.000000, bitrate: N/A",
      "[info]   Stream #0:0: Video: wrapped_avframe, rgb24, 320x240, 25 fps",
      "[info] Stream mapping:",
      "[info]   Stream #0:0 -> #0:0 (wrapped_avframe -> rawvideo)",
      "[info] Output #0, rawvideo, to 'out.raw':",
      "[info]   Stream #0:0: Video: rawvideo, rgb24, 320x240, 25 fps",
      "  trailing spaces kept  ",
  };
  auto events = parse_all(lines(input));
  ASSERT_EQ(events.size(), input.size() + 1);
  for (size_t i = 0; i < input.size(); ++i) {
    auto raw = raw_log_message(events[i]);
    ASSERT_TRUE(raw.has_value()) << i;
    EXPECT_EQ(*raw, input[i]);
  }
  EXPECT_FALSE(raw_log_message(events.back()).has_value());
}

TEST(LogParserTest, DurationOutsideInputIsInfoLog) {
  auto events = parse_all("[info]   Duration: 00:00:05.00, start: 0.0\n");
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(std::get<LogEvent>(events[0]).level, LogLevel::Info);
}

TEST(LogParserTest, StreamOutsideSectionIsParseError) {
  LogParser parser(pipe_from_string(
      "[info]   Stream #0:0: Video: rawvideo, rgb24, 4x2, 25 fps\n"));
  EXPECT_THROW(parser.parse_next_event(), ParseError);
}

TEST(LogParserTest, ProgressResetsSection) {
  LogParser parser(pipe_from_string(lines(
      {"Input #0, lavfi, from 'x':",
       "frame=1 fps=1 q=1 size=1kB time=00:00:01.00 bitrate=1kbits/s speed=1x",
       "  Stream #0:0: Video: rawvideo, rgb24, 4x2, 25 fps"})));
  EXPECT_TRUE(std::holds_alternative<InputDescriptor>(*parser.parse_next_event()));
  EXPECT_TRUE(std::holds_alternative<ProgressUpdate>(*parser.parse_next_event()));
  EXPECT_THROW(parser.parse_next_event(), ParseError);
}

TEST(LogParserTest, StreamInMappingSectionIsParseError) {
  LogParser parser(pipe_from_string(
      lines({"Stream mapping:", "Stream #0:0: Video: rawvideo, rgb24, 4x2"})));
  EXPECT_TRUE(std::holds_alternative<LogEvent>(*parser.parse_next_event()));
  EXPECT_THROW(parser.parse_next_event(), ParseError);
}

TEST(LogParserTest, MappingLinesNeedTwoLeadingSpaces) {
  auto events = parse_all(lines({"Stream mapping:",
                                 "  Stream #0:0 -> #0:0 (copy)",
                                 "  Stream #0:1 -> #0:1 (copy)",
                                 "Press [q] to stop, [?] for help"}));
  ASSERT_EQ(events.size(), 5u);
  EXPECT_TRUE(std::holds_alternative<StreamMappingEvent>(events[1]));
  EXPECT_TRUE(std::holds_alternative<StreamMappingEvent>(events[2]));
  EXPECT_EQ(std::get<LogEvent>(events[3]).level, LogLevel::Unknown);
}

TEST(LogParserTest, AllLineEndings) {
  auto events = parse_all("one\r\ntwo\rthree\n\n\nfour");
  ASSERT_EQ(events.size(), 5u);
  EXPECT_EQ(std::get<LogEvent>(events[0]).message, "one");
  EXPECT_EQ(std::get<LogEvent>(events[1]).message, "two");
  EXPECT_EQ(std::get<LogEvent>(events[2]).message, "three");
  EXPECT_EQ(std::get<LogEvent>(events[3]).message, "four");
  EXPECT_TRUE(std::holds_alternative<LogEofEvent>(events[4]));
}

TEST(LogParserTest, InvalidUtf8IsParseError) {
  LogParser parser(pipe_from_string("[info] bad \xff\xfe bytes\n"));
  EXPECT_THROW(parser.parse_next_event(), ParseError);
}

TEST(LogParserTest, Utf8IsAccepted) {
  auto events = parse_all("[info] title: caf\xc3\xa9 \xe2\x9c\x93\n");
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(std::get<LogEvent>(events[0]).level, LogLevel::Info);
}

TEST(LogParserTest, EndOfInputReportedOnce) {
  LogParser parser(pipe_from_string(""));
  auto first = parser.parse_next_event();
  ASSERT_TRUE(first.has_value());
  EXPECT_TRUE(std::holds_alternative<LogEofEvent>(*first));
  EXPECT_FALSE(parser.parse_next_event().has_value());
  EXPECT_FALSE(parser.parse_next_event().has_value());
}

TEST(Utf8Test, RejectsOverlongAndSurrogates) {
  EXPECT_TRUE(is_valid_utf8("plain ascii"));
  EXPECT_TRUE(is_valid_utf8("\xf0\x9f\x8e\xac"));
  EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));
  EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));
  EXPECT_FALSE(is_valid_utf8("\xe2\x9c"));
}
