/**
 * @file metadata.hpp
 * @brief Fold of the diagnostic event prefix into a sealed layout snapshot
 *
 * @details The number of "Stream mapping" lines announces how many output
 *          streams ffmpeg will describe. Once that many output stream
 *          descriptors have been folded, the metadata seals and never
 *          changes again.
 */

#ifndef FFSTREAM_METADATA_HPP
#define FFSTREAM_METADATA_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "event.hpp"

namespace ffstream {

/**
 * @class MetadataError
 * @brief Folding into sealed metadata, or a descriptor whose parent was
 *        never declared.
 */
class MetadataError : public std::logic_error {
public:
  explicit MetadataError(const std::string &what) : std::logic_error(what) {}
};

/**
 * @class Metadata
 * @brief Inputs, outputs and stream layouts announced by ffmpeg.
 *
 * @note Only the orchestrator mutates it; workers get a sealed copy.
 */
class Metadata {
public:
  /**
   * @brief Fold one event. Events that carry no metadata are ignored.
   * @throws MetadataError when sealed, or on an undeclared parent index
   */
  void handle_event(const Event &event);

  bool is_sealed() const { return sealed_; }

  /// First input's duration in seconds; other inputs are not reconciled
  std::optional<double> expected_duration() const;

  /// Count of stream mapping lines seen so far
  size_t expected_output_streams() const { return expected_output_streams_; }

  const std::vector<InputDescriptor> &inputs() const { return inputs_; }
  const std::vector<OutputDescriptor> &outputs() const { return outputs_; }
  const std::vector<StreamDescriptor> &input_streams() const {
    return input_streams_;
  }
  const std::vector<StreamDescriptor> &output_streams() const {
    return output_streams_;
  }

private:
  InputDescriptor *find_input(uint32_t index);
  bool has_output(uint32_t index) const;

  size_t expected_output_streams_ = 0;
  std::vector<InputDescriptor> inputs_;
  std::vector<OutputDescriptor> outputs_;
  std::vector<StreamDescriptor> input_streams_;
  std::vector<StreamDescriptor> output_streams_;
  bool sealed_ = false;
};

} // namespace ffstream

#endif // FFSTREAM_METADATA_HPP
