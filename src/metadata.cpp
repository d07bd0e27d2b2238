/**
 * @file metadata.cpp
 * @brief Metadata fold rules
 */

#include "ffstream/metadata.hpp"

#include <fmt/core.h>

namespace ffstream {

InputDescriptor *Metadata::find_input(uint32_t index) {
  for (auto &input : inputs_) {
    if (input.index == index)
      return &input;
  }
  return nullptr;
}

bool Metadata::has_output(uint32_t index) const {
  for (const auto &output : outputs_) {
    if (output.index == index)
      return true;
  }
  return false;
}

std::optional<double> Metadata::expected_duration() const {
  if (inputs_.empty())
    return std::nullopt;
  return inputs_.front().duration;
}

void Metadata::handle_event(const Event &event) {
  if (sealed_) {
    throw MetadataError(
        fmt::format("Metadata already sealed, cannot fold '{}' event",
                    event_name(event)));
  }

  if (const auto *input = std::get_if<InputDescriptor>(&event)) {
    inputs_.push_back(*input);
  } else if (const auto *duration = std::get_if<InputDuration>(&event)) {
    InputDescriptor *input = find_input(duration->input_index);
    if (!input) {
      throw MetadataError(fmt::format("Duration for undeclared input #{}",
                                      duration->input_index));
    }
    input->duration = duration->duration;
  } else if (const auto *output = std::get_if<OutputDescriptor>(&event)) {
    outputs_.push_back(*output);
  } else if (std::holds_alternative<StreamMappingEvent>(event)) {
    ++expected_output_streams_;
  } else if (const auto *in = std::get_if<InputStreamEvent>(&event)) {
    if (!find_input(in->stream.parent_index)) {
      throw MetadataError(fmt::format("Stream for undeclared input #{}: {}",
                                      in->stream.parent_index,
                                      in->stream.raw_log_message));
    }
    input_streams_.push_back(in->stream);
  } else if (const auto *out = std::get_if<OutputStreamEvent>(&event)) {
    if (!has_output(out->stream.parent_index)) {
      throw MetadataError(fmt::format("Stream for undeclared output #{}: {}",
                                      out->stream.parent_index,
                                      out->stream.raw_log_message));
    }
    output_streams_.push_back(out->stream);
  }

  if (expected_output_streams_ > 0 &&
      output_streams_.size() == expected_output_streams_) {
    sealed_ = true;
  }
}

} // namespace ffstream
