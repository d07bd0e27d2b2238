/**
 * @file pix_fmt.cpp
 * @brief Frame size lookup through libavutil
 */

#include "ffstream/pix_fmt.hpp"

extern "C" {
#include <libavutil/imgutils.h>
#include <libavutil/pixdesc.h>
}

namespace ffstream {

std::optional<size_t> frame_size(const std::string &pix_fmt, uint32_t width,
                                 uint32_t height) {
  if (width == 0 || height == 0)
    return std::nullopt;

  AVPixelFormat fmt = av_get_pix_fmt(pix_fmt.c_str());
  if (fmt == AV_PIX_FMT_NONE)
    return std::nullopt;

  const AVPixFmtDescriptor *desc = av_pix_fmt_desc_get(fmt);
  if (!desc)
    return std::nullopt;

  /// Hardware surfaces never reach the pipe; the raw muxer appends a
  /// palette after palettized frames
  if (desc->flags & (AV_PIX_FMT_FLAG_HWACCEL | AV_PIX_FMT_FLAG_PAL))
    return std::nullopt;

  int bpp = av_get_bits_per_pixel(desc);
  if (bpp <= 0)
    return std::nullopt;

  uint64_t bits = static_cast<uint64_t>(width) * height * bpp;
  if (bits % 8 != 0)
    return std::nullopt;
  uint64_t bytes = bits / 8;

  /// Odd sizes round subsampled planes and bit-packed rows up; only trust
  /// the whole-frame formula where libavutil's packed layout agrees
  if (width <= INT32_MAX && height <= INT32_MAX) {
    int packed = av_image_get_buffer_size(fmt, static_cast<int>(width),
                                          static_cast<int>(height), 1);
    if (packed < 0 || static_cast<uint64_t>(packed) != bytes)
      return std::nullopt;
  }

  return static_cast<size_t>(bytes);
}

} // namespace ffstream
