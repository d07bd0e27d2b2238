/**
 * @file demuxer.cpp
 * @brief Stdout demux strategies
 */

#include "ffstream/demuxer.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

#include <fmt/core.h>

#include "ffstream/logging.hpp"
#include "ffstream/pix_fmt.hpp"

namespace ffstream {

namespace {

bool is_raw_video(const StreamDescriptor &stream) {
  return stream.is_video() && stream.format == "rawvideo";
}

} // anonymous namespace

const char *demux_mode_name(DemuxMode mode) {
  switch (mode) {
  case DemuxMode::None:
    return "none";
  case DemuxMode::Framed:
    return "framed";
  case DemuxMode::Chunked:
    return "chunked";
  case DemuxMode::Unsupported:
    return "unsupported";
  }
  return "unknown";
}

DemuxPlan plan_demux(const std::vector<StreamDescriptor> &output_streams,
                     const std::vector<OutputDescriptor> &outputs) {
  DemuxPlan plan;

  for (const auto &stream : output_streams) {
    auto output = std::find_if(outputs.begin(), outputs.end(),
                               [&](const OutputDescriptor &o) {
                                 return o.index == stream.parent_index;
                               });
    if (output != outputs.end() && output->is_stdout())
      plan.streams.push_back(stream);
  }

  if (plan.streams.empty()) {
    plan.mode = DemuxMode::None;
    plan.reason = "no output stream is written to stdout";
    return plan;
  }

  size_t raw_count = static_cast<size_t>(
      std::count_if(plan.streams.begin(), plan.streams.end(), is_raw_video));

  if (raw_count == 0) {
    plan.mode = DemuxMode::Chunked;
    plan.reason = "stdout carries encoded streams";
    return plan;
  }

  if (raw_count != plan.streams.size()) {
    plan.mode = DemuxMode::Unsupported;
    plan.reason = "raw and encoded streams are mixed on stdout";
    return plan;
  }

  for (const auto &stream : plan.streams) {
    const VideoInfo *video = stream.video();
    auto size = frame_size(video->pix_fmt, video->width, video->height);
    if (!size) {
      plan.mode = DemuxMode::Chunked;
      plan.frame_sizes.clear();
      plan.reason = fmt::format("no fixed frame size for {} {}x{}",
                                video->pix_fmt, video->width, video->height);
      return plan;
    }
    plan.frame_sizes.push_back(*size);
  }

  float fps = plan.streams.front().video()->fps;
  for (const auto &stream : plan.streams) {
    if (stream.video()->fps != fps || stream.video()->fps <= 0.0f) {
      LOG_WARN("Raw streams on stdout do not share one known frame rate, "
               "falling back to chunks");
      plan.mode = DemuxMode::Chunked;
      plan.frame_sizes.clear();
      plan.reason = "frame rates differ or are unknown";
      return plan;
    }
  }

  plan.mode = DemuxMode::Framed;
  plan.fps = fps;
  plan.reason = fmt::format("{} raw stream(s) at {} fps", plan.streams.size(),
                            fps);
  return plan;
}

Demuxer::Demuxer(FileHandle source, DemuxPlan plan, size_t chunk_size)
    : source_(std::move(source)), plan_(std::move(plan)),
      chunk_size_(std::max<size_t>(chunk_size, 1)) {}

void Demuxer::run(Sender<Event> &tx) {
  LOG_DEBUG("Demuxer started: {} ({})", demux_mode_name(plan_.mode),
            plan_.reason);

  bool receiver_alive = true;
  try {
    switch (plan_.mode) {
    case DemuxMode::None:
      break;
    case DemuxMode::Unsupported:
      receiver_alive = tx.send(ErrorEvent{
          fmt::format("Unsupported stdout configuration: {}", plan_.reason)});
      break;
    case DemuxMode::Framed:
      receiver_alive = run_framed(tx);
      break;
    case DemuxMode::Chunked:
      receiver_alive = run_chunked(tx);
      break;
    }
  } catch (const std::exception &e) {
    /// Read failures are handled per mode; this is allocation and the like
    LOG_ERROR("Demuxer failed: {}", e.what());
    receiver_alive =
        tx.send(ErrorEvent{fmt::format("demuxer failed: {}", e.what())});
  }

  if (receiver_alive)
    tx.send(DoneEvent{});
  LOG_DEBUG("Demuxer stopped");
}

bool Demuxer::run_framed(Sender<Event> &tx) {
  const size_t stream_count = plan_.streams.size();
  std::vector<uint32_t> frame_nums(stream_count, 0);

  try {
    for (;;) {
      for (size_t i = 0; i < stream_count; ++i) {
        const VideoInfo *video = plan_.streams[i].video();

        std::vector<uint8_t> data(plan_.frame_sizes[i]);
        if (!source_.read_exact(data.data(), data.size()))
          return true; /// Short read: clean end

        OutputFrame frame;
        frame.width = video->width;
        frame.height = video->height;
        frame.pix_fmt = video->pix_fmt;
        frame.output_index = static_cast<uint32_t>(i);
        frame.frame_num = frame_nums[i]++;
        frame.timestamp = static_cast<double>(frame.frame_num) / video->fps;
        frame.data = std::move(data);

        if (!tx.send(std::move(frame)))
          return false;
      }
    }
  } catch (const std::system_error &e) {
    LOG_ERROR("Failed to read frame from stdout: {}", e.what());
    return tx.send(ErrorEvent{fmt::format("stdout read failed: {}", e.what())});
  }
}

bool Demuxer::run_chunked(Sender<Event> &tx) {
  std::vector<uint8_t> buf(chunk_size_);

  try {
    for (;;) {
      size_t n = source_.read_some(buf.data(), buf.size());
      if (n == 0)
        return true;
      OutputChunk chunk;
      chunk.data.assign(buf.begin(), buf.begin() + static_cast<long>(n));
      if (!tx.send(std::move(chunk)))
        return false;
    }
  } catch (const std::system_error &e) {
    LOG_ERROR("Failed to read chunk from stdout: {}", e.what());
    return tx.send(ErrorEvent{fmt::format("stdout read failed: {}", e.what())});
  }
}

} // namespace ffstream
