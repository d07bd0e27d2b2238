/**
 * @file command.cpp
 * @brief FfmpegCommand and the -version helpers
 */

#include "ffstream/command.hpp"

#include <optional>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>

#include "ffstream/log_parser.hpp"
#include "ffstream/logging.hpp"

namespace ffstream {

FfmpegCommand::FfmpegCommand(std::string program)
    : program_(std::move(program)) {
  args_ = {"-loglevel", "level+info"};
}

FfmpegCommand &FfmpegCommand::arg(std::string token) {
  args_.push_back(std::move(token));
  return *this;
}

FfmpegCommand &FfmpegCommand::args(const std::vector<std::string> &tokens) {
  args_.insert(args_.end(), tokens.begin(), tokens.end());
  return *this;
}

FfmpegCommand &FfmpegCommand::input(const std::string &path) {
  return args({"-i", path});
}

FfmpegCommand &FfmpegCommand::output(const std::string &path) {
  return arg(path);
}

FfmpegCommand &FfmpegCommand::format(const std::string &fmt) {
  return args({"-f", fmt});
}

FfmpegCommand &FfmpegCommand::codec_video(const std::string &codec) {
  return args({"-c:v", codec});
}

FfmpegCommand &FfmpegCommand::codec_audio(const std::string &codec) {
  return args({"-c:a", codec});
}

FfmpegCommand &FfmpegCommand::pix_fmt(const std::string &pix_fmt) {
  return args({"-pix_fmt", pix_fmt});
}

FfmpegCommand &FfmpegCommand::rate(float fps) {
  return args({"-r", fmt::format("{}", fps)});
}

FfmpegCommand &FfmpegCommand::size(uint32_t width, uint32_t height) {
  return args({"-s", fmt::format("{}x{}", width, height)});
}

FfmpegCommand &FfmpegCommand::duration(const std::string &duration) {
  return args({"-t", duration});
}

FfmpegCommand &FfmpegCommand::frames(uint32_t count) {
  return args({"-frames:v", std::to_string(count)});
}

FfmpegCommand &FfmpegCommand::overwrite() { return arg("-y"); }

FfmpegCommand &FfmpegCommand::no_audio() { return arg("-an"); }

FfmpegCommand &FfmpegCommand::hide_banner() { return arg("-hide_banner"); }

FfmpegCommand &FfmpegCommand::filter(const std::string &graph) {
  return args({"-filter", graph});
}

FfmpegCommand &FfmpegCommand::testsrc() {
  return args({"-f", "lavfi", "-i", "testsrc=duration=10"});
}

FfmpegCommand &FfmpegCommand::rawvideo() {
  return args({"-f", "rawvideo", "-pix_fmt", "rgb24", "-"});
}

FfmpegCommand &FfmpegCommand::pipe_stdout() { return arg("-"); }

std::string FfmpegCommand::to_string() const {
  std::string out = program_;
  for (const auto &token : args_) {
    out += ' ';
    out += token;
  }
  return out;
}

ChildProcess FfmpegCommand::spawn() const {
  std::vector<std::string> argv;
  argv.reserve(args_.size() + 1);
  argv.push_back(program_);
  argv.insert(argv.end(), args_.begin(), args_.end());

  LOG_DEBUG("Running: {}", to_string());
  return ChildProcess::spawn(argv);
}

// **---- Single-shot helpers ----**

std::string ffmpeg_version(const std::string &program) {
  ChildProcess child = ChildProcess::spawn({program, "-version"});

  /// -version prints to stdout, not stderr
  std::optional<std::string> version;
  {
    LogParser parser(child.take_stdout());
    while (auto event = parser.parse_next_event()) {
      if (auto *v = std::get_if<VersionEvent>(&*event)) {
        if (!version)
          version = v->version;
      }
    }
  }

  int status = child.wait();
  if (status != 0) {
    throw std::runtime_error(
        fmt::format("{} -version exited with status {}", program, status));
  }
  if (!version) {
    throw std::runtime_error(
        fmt::format("Failed to parse version from {} -version", program));
  }
  return *version;
}

bool ffmpeg_is_installed(const std::string &program) {
  try {
    ChildProcess child = ChildProcess::spawn({program, "-version"});
    FileHandle out = child.take_stdout();
    uint8_t buf[4096];
    while (out.read_some(buf, sizeof(buf)) > 0) {
    }
    return child.wait() == 0;
  } catch (const std::system_error &e) {
    LOG_DEBUG("{} is not usable: {}", program, e.what());
    return false;
  }
}

} // namespace ffstream
