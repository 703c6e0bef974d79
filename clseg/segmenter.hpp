#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

#include "clseg/audio.hpp"
#include "clseg/boundaries.hpp"
#include "clseg/conditioning.hpp"
#include "clseg/config.hpp"
#include "clseg/metadata.hpp"

namespace clseg {

struct render_summary {
  std::size_t candidates = 0;
  std::size_t written    = 0;
  std::size_t skipped    = 0;
  std::vector<std::filesystem::path> files;
  std::filesystem::path metadata_file;
};

// Cut signal at the boundaries, drop candidates shorter than
// config.min_length, condition the rest (fade, filter, normalise) and write
// them as <base>_<n>.wav, numbered from 1 over survivors. Every file gets the
// metadata tags; the record is also written once as a JSON side-car.
// A cutoff at or above the signal's Nyquist frequency throws
// std::invalid_argument before anything is written.
render_summary
render_segments(interleaved<float> const &signal, boundary_set const &boundaries,
  segment_config const &config, metadata_record const &metadata,
  conditioner const &dsp
);

// <base>_segments.txt with one "<start>\t<end>" line per adjacent boundary
// pair. Returns the path written.
std::filesystem::path
export_boundaries(boundary_set const &boundaries, segment_config const &config);

// Slice source at its native rate by the time ranges listed in text_file and
// write fade-conditioned float WAVs segment_<i>.wav into output_directory.
// The whole file is validated before the first write.
std::vector<std::filesystem::path>
segment_using_text(std::filesystem::path const &source,
  std::filesystem::path const &text_file,
  std::filesystem::path const &output_directory,
  segment_config const &config, conditioner const &dsp
);

// Supplies the render / export / abort decision.
using action_provider = std::move_only_function<segment_action()>;

// Terminal prompt. Unrecognised input and end of input both mean abort.
[[nodiscard]] segment_action prompt_action();

// Preset action from the configuration, the terminal prompt otherwise.
[[nodiscard]] action_provider default_action_provider(segment_config const &config);

// Ask provider once and carry out its answer. Returns the action taken.
segment_action
route_boundaries(interleaved<float> const &signal, boundary_set const &boundaries,
  segment_config const &config, metadata_record const &metadata,
  conditioner const &dsp, action_provider &provider
);

// Whole invocation for one input file: provider is asked once, after
// detection or before the text method slices. Throws on fatal errors.
void run(segment_config const &config, action_provider provider);

}
