/**
 * @file comma_iter.hpp
 * @brief Comma tokenizer that ignores commas inside parentheses
 *
 * @details Stream descriptor fields look like
 *          "yuv444p(tv, progressive), 320x240 [SAR 1:1 DAR 4:3], 25 fps"
 *          where a plain split on ',' would cut the pixel format apart.
 *          One level of parentheses is recognized.
 */

#ifndef FFSTREAM_COMMA_ITER_HPP
#define FFSTREAM_COMMA_ITER_HPP

#include <optional>
#include <string_view>
#include <vector>

namespace ffstream {

/**
 * @class CommaIter
 * @brief Yields the comma-separated sections of a string, untrimmed.
 * @note The viewed string must outlive the iterator.
 */
class CommaIter {
public:
  explicit CommaIter(std::string_view text) : rest_(text) {}

  /// Next section without its trailing comma; nullopt when exhausted
  std::optional<std::string_view> next();

  /// Drain the remaining sections
  std::vector<std::string_view> collect();

private:
  std::string_view rest_;
  bool done_ = false;
};

} // namespace ffstream

#endif // FFSTREAM_COMMA_ITER_HPP
