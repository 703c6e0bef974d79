#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "clseg/conditioning.hpp"

namespace clseg {

enum class segmentation_method { Onset, Beat, Text };

// Outcome of the render / export / abort decision.
enum class segment_action { Render, Export, Abort };

[[nodiscard]] std::optional<segmentation_method> parse_segmentation_method(std::string_view name);
[[nodiscard]] std::optional<segment_action> parse_segment_action(std::string_view name);

[[nodiscard]] std::string_view to_string(segmentation_method method) noexcept;

struct analysis_settings {
  std::uint32_t sample_rate = 48000;
  std::uint32_t n_fft       = 2048;
  std::uint32_t hop_size    = 512;
  double onset_threshold    = 0.1;
  bool adjust_resolution    = true;
};

// Resolved once from the command line; read-only afterwards.
struct segment_config {
  std::filesystem::path input_file;
  std::filesystem::path output_directory;
  std::filesystem::path input_text;          // text method only
  segmentation_method method = segmentation_method::Onset;
  bool save_text = false;

  double min_length = 0.1;                   // seconds
  int fade_duration_ms = 20;
  fade_curve curve = fade_curve::Exponential;
  double filter_frequency = 40.0;            // Hz, 0 disables
  filter_type filter_kind = filter_type::High;
  double normalisation_level = -3.0;         // dB
  normalisation_mode normalisation = normalisation_mode::Peak;

  analysis_settings analysis;

  // Preselected decision; the selector prompts when unset.
  std::optional<segment_action> action;
};

// <output_directory>/<input filename up to its first '.'>
[[nodiscard]] std::filesystem::path base_segment_path(segment_config const &config);

// nullopt when help was requested.
[[nodiscard]] std::expected<std::optional<segment_config>, std::string>
parse_options(int argc, char **argv);

[[nodiscard]] std::string usage(std::string_view program);

}
