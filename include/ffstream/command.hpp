/**
 * @file command.hpp
 * @brief ffmpeg command line builder and single-shot helpers
 *
 * @details FfmpegCommand only collects argument tokens; it knows nothing
 *          about their meaning and does not validate them. The constructor
 *          adds "-loglevel level+info", which makes ffmpeg prefix every
 *          line with its severity, the shape LogParser expects.
 */

#ifndef FFSTREAM_COMMAND_HPP
#define FFSTREAM_COMMAND_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "config.hpp"
#include "process.hpp"

namespace ffstream {

/**
 * @class FfmpegCommand
 * @brief Chainable argument builder.
 *
 * @note Argument order matters to ffmpeg: options before input() apply to
 *       that input, options before output() apply to that output.
 */
class FfmpegCommand {
public:
  explicit FfmpegCommand(std::string program = Config::ffmpeg_path());

  FfmpegCommand &arg(std::string token);
  FfmpegCommand &args(const std::vector<std::string> &tokens);

  /// "-i <path>"
  FfmpegCommand &input(const std::string &path);
  /// Positional output path ("-" for stdout)
  FfmpegCommand &output(const std::string &path);
  /// "-f <fmt>"
  FfmpegCommand &format(const std::string &fmt);
  FfmpegCommand &codec_video(const std::string &codec);
  FfmpegCommand &codec_audio(const std::string &codec);
  FfmpegCommand &pix_fmt(const std::string &pix_fmt);
  /// "-r <fps>"
  FfmpegCommand &rate(float fps);
  /// "-s WxH"
  FfmpegCommand &size(uint32_t width, uint32_t height);
  /// "-t <duration>", e.g. "5" or "00:00:05"
  FfmpegCommand &duration(const std::string &duration);
  /// "-frames:v <count>"
  FfmpegCommand &frames(uint32_t count);
  FfmpegCommand &overwrite();
  FfmpegCommand &no_audio();
  FfmpegCommand &hide_banner();
  /// "-filter <graph>"
  FfmpegCommand &filter(const std::string &graph);

  // **---- Presets ----**

  /// 10 second lavfi test pattern as input
  FfmpegCommand &testsrc();
  /// rgb24 raw frames to stdout
  FfmpegCommand &rawvideo();
  /// Output to stdout, format left to the caller
  FfmpegCommand &pipe_stdout();

  const std::string &program() const { return program_; }
  const std::vector<std::string> &get_args() const { return args_; }

  /// Program and arguments joined by spaces (for logs; not shell-quoted)
  std::string to_string() const;

  /**
   * @brief Start ffmpeg with these arguments.
   * @throws std::system_error if the program cannot be started
   */
  ChildProcess spawn() const;

private:
  std::string program_;
  std::vector<std::string> args_;
};

/**
 * @brief Version token reported by "<program> -version".
 * @throws std::system_error if the program cannot be started
 * @throws std::runtime_error on non-zero exit or unparseable output
 */
std::string ffmpeg_version(const std::string &program = Config::ffmpeg_path());

/// True if "<program> -version" runs and exits with status 0
bool ffmpeg_is_installed(const std::string &program = Config::ffmpeg_path());

} // namespace ffstream

#endif // FFSTREAM_COMMAND_HPP
