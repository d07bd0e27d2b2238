/**
 * @file demuxer.hpp
 * @brief Slices ffmpeg's stdout into whole frames or opaque chunks
 *
 * @details The strategy is chosen once from sealed metadata:
 *
 *          - Framed: every stdout stream is rawvideo with a known frame size
 *            and all share one positive fps. Frames are read in round-robin
 *            order of declaration.
 *
 *          - Chunked: anything else that is still consistent. Bytes are
 *            forwarded as they arrive.
 *
 *          - Unsupported: raw and non-raw streams mixed on stdout.
 *
 *          - None: nothing is written to stdout.
 */

#ifndef FFSTREAM_DEMUXER_HPP
#define FFSTREAM_DEMUXER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "channel.hpp"
#include "config.hpp"
#include "event.hpp"
#include "file_handle.hpp"

namespace ffstream {

enum class DemuxMode { None, Framed, Chunked, Unsupported };

const char *demux_mode_name(DemuxMode mode);

/**
 * @struct DemuxPlan
 * @brief Strategy decided after sealing, reused for every read.
 */
struct DemuxPlan {
  DemuxMode mode = DemuxMode::None;
  std::vector<StreamDescriptor> streams; //< Streams bound for stdout, in order
  std::vector<size_t> frame_sizes;       //< Framed mode: bytes per stream
  float fps = 0.0f;                      //< Framed mode: shared rate
  std::string reason;                    //< Why this mode (for logs/errors)
};

/**
 * @brief Choose the demux strategy for the streams written to stdout.
 * @param output_streams Sealed output stream descriptors
 * @param outputs Sealed output descriptors
 */
DemuxPlan plan_demux(const std::vector<StreamDescriptor> &output_streams,
                     const std::vector<OutputDescriptor> &outputs);

/**
 * @class Demuxer
 * @brief Stdout worker body.
 */
class Demuxer {
public:
  Demuxer(FileHandle source, DemuxPlan plan,
          size_t chunk_size = Config::chunk_size());

  /**
   * @brief Read until end of input and send the resulting events.
   * @note Sends exactly one DoneEvent at the end unless the receiver is
   *       gone, in which case it returns silently.
   */
  void run(Sender<Event> &tx);

private:
  /// @return false if the receiver is gone
  bool run_framed(Sender<Event> &tx);
  bool run_chunked(Sender<Event> &tx);

  FileHandle source_;
  DemuxPlan plan_;
  size_t chunk_size_;
};

} // namespace ffstream

#endif // FFSTREAM_DEMUXER_HPP
