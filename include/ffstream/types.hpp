/**
 * @file types.hpp
 * @brief Core data types describing ffmpeg inputs, outputs and streams
 *
 * @details Contains the structures carried by events and folded into
 *          metadata:
 *          - StreamDescriptor with per-type payload (video, audio, ...)
 *
 *          - InputDescriptor / OutputDescriptor
 *
 *          - ProgressUpdate
 *
 *          - OutputFrame / OutputChunk for stdout payload
 *
 * @note Every type that originates from a diagnostic line keeps the exact
 *       line text (without its terminator) in raw_log_message.
 */

#ifndef FFSTREAM_TYPES_HPP
#define FFSTREAM_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ffstream {

// **----- STREAM DESCRIPTORS -----**

/// Fields only present on video streams
struct VideoInfo {
  std::string pix_fmt; //< e.g. "rgb24", annotations like "(tv)" stripped
  uint32_t width = 0;
  uint32_t height = 0;
  float fps = 0.0f; //< 0 when the descriptor carries no "fps" field
};

/// Fields only present on audio streams
struct AudioInfo {
  uint32_t sample_rate = 0; //< Hz
  std::string channels;     //< Layout label: "mono", "stereo", "5.1", ...
};

struct SubtitleInfo {};
struct OtherInfo {};

enum class StreamType { Video, Audio, Subtitle, Other };

/**
 * @struct StreamDescriptor
 * @brief One elementary stream of a declared input or output.
 *
 * @note parent_index refers to the owning "Input #N" or "Output #N";
 *       stream_index is the position within that parent.
 */
struct StreamDescriptor {
  std::string format;   //< Codec name, e.g. "rawvideo", "h264", "opus"
  std::string language; //< Three-letter code, empty when absent
  uint32_t parent_index = 0;
  uint32_t stream_index = 0;
  std::variant<VideoInfo, AudioInfo, SubtitleInfo, OtherInfo> type_data;
  std::string raw_log_message;

  StreamType type() const {
    return static_cast<StreamType>(type_data.index());
  }
  bool is_video() const { return type() == StreamType::Video; }
  bool is_audio() const { return type() == StreamType::Audio; }
  bool is_subtitle() const { return type() == StreamType::Subtitle; }
  bool is_other() const { return type() == StreamType::Other; }

  const VideoInfo *video() const { return std::get_if<VideoInfo>(&type_data); }
  const AudioInfo *audio() const { return std::get_if<AudioInfo>(&type_data); }
};

// **----- INPUTS / OUTPUTS -----**

/// "Input #N, fmt, from 'src':"
struct InputDescriptor {
  uint32_t index = 0;
  std::optional<double> duration; //< Seconds, filled from the Duration line
  std::string raw_log_message;
};

/// "  Duration: 00:00:05.00, start: ..." inside an input section
struct InputDuration {
  uint32_t input_index = 0;
  double duration = 0.0; //< Seconds
  std::string raw_log_message;
};

/// "Output #N, fmt, to 'dest':"
struct OutputDescriptor {
  uint32_t index = 0;
  std::string to; //< Destination between the quotes
  std::string raw_log_message;

  /// True when ffmpeg writes this output to its own standard output
  bool is_stdout() const;
};

// **----- PROGRESS -----**

/**
 * @struct ProgressUpdate
 * @brief One "frame= ... speed=" status line.
 * @note Fields reported as "N/A" are zero.
 */
struct ProgressUpdate {
  uint32_t frame = 0;
  float fps = 0.0f;
  float q = 0.0f;
  uint32_t size_kb = 0;
  std::string time; //< Verbatim, e.g. "00:01:19.72"
  float bitrate_kbps = 0.0f;
  float speed = 0.0f;
  std::string raw_log_message;
};

// **----- STDOUT PAYLOAD -----**

/**
 * @struct OutputFrame
 * @brief One whole raw video frame read from stdout in framed mode.
 * @note data.size() always equals the table size for pix_fmt/width/height.
 */
struct OutputFrame {
  uint32_t width = 0;
  uint32_t height = 0;
  std::string pix_fmt;
  uint32_t output_index = 0; //< Position among the streams sent to stdout
  uint32_t frame_num = 0;    //< Per-stream counter starting at 0
  double timestamp = 0.0;    //< frame_num / fps, in seconds
  std::vector<uint8_t> data;
};

/// Opaque stdout bytes read in chunked mode; boundaries mean nothing
struct OutputChunk {
  std::vector<uint8_t> data;
};

} // namespace ffstream

#endif // FFSTREAM_TYPES_HPP
