/**
 * @file pix_fmt.hpp
 * @brief Whole-frame byte size of raw video pixel formats
 *
 * @details Names resolve through libavutil's pixel format descriptors, so
 *          the set of known names is exactly what libavutil enumerates.
 *          Sizes are computed over the whole frame in 64-bit before dividing
 *          by 8, which keeps sub-byte-per-pixel formats (yuv420p = 12 bpp,
 *          monob = 1 bpp) exact.
 */

#ifndef FFSTREAM_PIX_FMT_HPP
#define FFSTREAM_PIX_FMT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace ffstream {

/**
 * @brief Bytes the raw muxer writes for one frame.
 * @return nullopt for unknown names, formats without a fixed frame size
 *         (hardware, palettized, padded rows) and zero dimensions
 */
std::optional<size_t> frame_size(const std::string &pix_fmt, uint32_t width,
                                 uint32_t height);

} // namespace ffstream

#endif // FFSTREAM_PIX_FMT_HPP
