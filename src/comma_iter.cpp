/**
 * @file comma_iter.cpp
 * @brief CommaIter implementation
 */

#include "ffstream/comma_iter.hpp"

namespace ffstream {

std::optional<std::string_view> CommaIter::next() {
  if (done_ || rest_.empty())
    return std::nullopt;

  size_t i = 0;
  while (i < rest_.size()) {
    char c = rest_[i];
    if (c == '(') {
      /// Skip to the closing paren (single nesting level)
      size_t close = rest_.find(')', i + 1);
      i = (close == std::string_view::npos) ? rest_.size() : close + 1;
      continue;
    }
    if (c == ',')
      break;
    ++i;
  }

  std::string_view section = rest_.substr(0, i);
  if (i < rest_.size()) {
    rest_.remove_prefix(i + 1);
  } else {
    rest_ = {};
    done_ = true;
  }
  return section;
}

std::vector<std::string_view> CommaIter::collect() {
  std::vector<std::string_view> out;
  while (auto section = next())
    out.push_back(*section);
  return out;
}

} // namespace ffstream
