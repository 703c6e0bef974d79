#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

namespace clseg {

// The analysis frame grid a detector ran on. Frame f is the window starting
// at f * hop_size.
struct analysis_grid {
  std::uint32_t hop_size    = 512;
  std::uint32_t n_fft       = 2048;
  std::uint32_t sample_rate = 48000;

  [[nodiscard]] double frame_to_sample(std::size_t frame) const noexcept
  { return double(frame) * hop_size; }

  // Nearest frame to a sample position; negative positions map to 0.
  [[nodiscard]] std::size_t sample_to_frame(double sample) const noexcept;
};

struct frame_boundaries {
  std::vector<std::size_t> frames;
  analysis_grid grid;
  // Analysis samples the frames were detected on, 0 if unknown. Frame
  // positions past it are clamped to it.
  std::size_t signal_length = 0;

  [[nodiscard]] double position(std::size_t frame) const noexcept;
};

struct sample_boundaries {
  std::vector<std::size_t> samples;
  std::uint32_t sample_rate = 0;
};

struct time_boundaries {
  std::vector<double> seconds;
};

// Ordered boundary positions, tagged with their unit.
using boundary_set =
  std::variant<frame_boundaries, sample_boundaries, time_boundaries>;

[[nodiscard]] std::size_t boundary_count(boundary_set const &boundaries);

[[nodiscard]] std::vector<double> to_seconds(boundary_set const &boundaries);

// Absolute sample offsets at sample_rate, clamped to [0, length].
[[nodiscard]] std::vector<std::size_t>
to_sample_offsets(boundary_set const &boundaries,
  std::uint32_t sample_rate, std::size_t length
);

struct time_range {
  double start_sec = 0.0;
  double end_sec   = 0.0;
};

// Seconds -> milliseconds -> nearest sample at sample_rate.
[[nodiscard]] std::size_t time_to_sample(double seconds, std::uint32_t sample_rate);

// One "<start> <end>" pair per line, whitespace separated, further tokens
// ignored. Any malformed line fails the whole parse.
[[nodiscard]] std::expected<std::vector<time_range>, std::string>
parse_boundary_text(std::istream &in);

[[nodiscard]] std::expected<std::vector<time_range>, std::string>
read_boundary_text(std::filesystem::path const &file);

// "<start>\t<end>\n" with six decimals.
[[nodiscard]] std::string format_boundary_line(double start_sec, double end_sec);

}
