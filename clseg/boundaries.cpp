#include "clseg/boundaries.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <istream>
#include <sstream>

#include "clseg/util.hpp"

namespace clseg {

namespace {

using std::expected, std::unexpected;
using std::filesystem::path;
using std::string, std::string_view;
using std::vector;

template<typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

[[nodiscard]] std::size_t clamp_offset(double sample, std::size_t length) noexcept
{
  if (!(sample > 0.0)) return 0;
  const double rounded = std::round(sample);
  if (rounded >= double(length)) return length;
  return static_cast<std::size_t>(rounded);
}

[[nodiscard]] expected<double, string>
parse_time(string_view token)
{
  auto v = parse_number<double>(token);
  if (!v) return unexpected(std::format("'{}' is {}", token, v.error()));
  if (!std::isfinite(*v)) return unexpected(std::format("'{}' is not finite", token));
  if (*v < 0.0) return unexpected(std::format("'{}' is negative", token));
  return *v;
}

}

std::size_t analysis_grid::sample_to_frame(double sample) const noexcept
{
  if (!(sample > 0.0) || hop_size == 0) return 0;
  return static_cast<std::size_t>(std::llround(sample / hop_size));
}

double frame_boundaries::position(std::size_t frame) const noexcept
{
  const double sample = grid.frame_to_sample(frame);
  if (signal_length > 0) return std::min(sample, double(signal_length));
  return sample;
}

std::size_t boundary_count(boundary_set const &boundaries)
{
  return std::visit(overloaded{
    [](frame_boundaries const &b)  { return b.frames.size(); },
    [](sample_boundaries const &b) { return b.samples.size(); },
    [](time_boundaries const &b)   { return b.seconds.size(); }
  }, boundaries);
}

vector<double> to_seconds(boundary_set const &boundaries)
{
  return std::visit(overloaded{
    [](frame_boundaries const &b) {
      vector<double> out;
      out.reserve(b.frames.size());
      for (auto frame: b.frames)
        out.push_back(b.position(frame) / b.grid.sample_rate);
      return out;
    },
    [](sample_boundaries const &b) {
      vector<double> out;
      out.reserve(b.samples.size());
      for (auto sample: b.samples)
        out.push_back(double(sample) / b.sample_rate);
      return out;
    },
    [](time_boundaries const &b) { return b.seconds; }
  }, boundaries);
}

vector<std::size_t>
to_sample_offsets(boundary_set const &boundaries,
  std::uint32_t sample_rate, std::size_t length
) {
  auto convert = [&](auto const &positions, auto &&to_target) {
    vector<std::size_t> out;
    out.reserve(positions.size());
    for (auto position: positions)
      out.push_back(clamp_offset(to_target(position), length));
    return out;
  };

  return std::visit(overloaded{
    [&](frame_boundaries const &b) {
      const double scale = double(sample_rate) / b.grid.sample_rate;
      return convert(b.frames, [&](std::size_t frame) {
        return b.position(frame) * scale;
      });
    },
    [&](sample_boundaries const &b) {
      const double scale = double(sample_rate) / b.sample_rate;
      return convert(b.samples, [&](std::size_t sample) {
        return double(sample) * scale;
      });
    },
    [&](time_boundaries const &b) {
      return convert(b.seconds, [&](double seconds) {
        return double(time_to_sample(seconds, sample_rate));
      });
    }
  }, boundaries);
}

std::size_t time_to_sample(double seconds, std::uint32_t sample_rate)
{
  if (!(seconds > 0.0)) return 0;
  const double time_ms = seconds * 1000.0;
  return static_cast<std::size_t>(std::llround(time_ms * sample_rate / 1000.0));
}

expected<vector<time_range>, string>
parse_boundary_text(std::istream &in)
{
  vector<time_range> ranges;
  string line;
  for (std::size_t line_no = 1; std::getline(in, line); ++line_no) {
    std::istringstream tokens(line);
    string start_token, end_token;
    if (!(tokens >> start_token >> end_token)) {
      return unexpected(std::format(
        "line {}: expected '<start> <end>', got '{}'", line_no, line
      ));
    }

    auto start = parse_time(start_token);
    if (!start) return unexpected(std::format("line {}: start {}", line_no, start.error()));
    auto end = parse_time(end_token);
    if (!end) return unexpected(std::format("line {}: end {}", line_no, end.error()));

    if (!(*start < *end)) {
      return unexpected(std::format(
        "line {}: start {} is not before end {}", line_no, *start, *end
      ));
    }

    ranges.push_back({*start, *end});
  }

  if (in.bad()) return unexpected(string("read error"));

  return ranges;
}

expected<vector<time_range>, string>
read_boundary_text(path const &file)
{
  std::ifstream in(file);
  if (!in) {
    return unexpected("Cannot open boundary file: " + file.generic_string());
  }
  return parse_boundary_text(in).transform_error([&](string error_msg) {
    return file.generic_string() + ": " + error_msg;
  });
}

string format_boundary_line(double start_sec, double end_sec)
{
  return std::format("{:.6f}\t{:.6f}\n", start_sec, end_sec);
}

}
