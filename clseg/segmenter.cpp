#include "clseg/segmenter.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <readline/readline.h>

#include "clseg/detection.hpp"

namespace clseg {

namespace {

using std::cerr, std::cout;
using std::filesystem::create_directories;
using std::filesystem::path;
using std::println;
using std::runtime_error;
using std::string, std::string_view;
using std::unique_ptr;
using std::vector;

[[nodiscard]] string_view trim(string_view s) noexcept
{
  constexpr string_view blanks = " \t\r\n";
  const auto first = s.find_first_not_of(blanks);
  if (first == string_view::npos) return {};
  return s.substr(first, s.find_last_not_of(blanks) - first + 1);
}

template<typename T>
[[nodiscard]] T value_or_throw(std::expected<T, string> result)
{
  if (!result) throw runtime_error(result.error());
  return std::move(*result);
}

}

render_summary
render_segments(interleaved<float> const &signal, boundary_set const &boundaries,
  segment_config const &config, metadata_record const &metadata,
  conditioner const &dsp
) {
  if (config.filter_frequency > 0.0 && config.filter_frequency >= signal.sample_rate / 2.0) {
    throw std::invalid_argument(std::format(
      "filter frequency {} Hz is not below Nyquist ({} Hz) of {}",
      config.filter_frequency, signal.sample_rate / 2.0,
      config.input_file.generic_string()
    ));
  }

  create_directories(config.output_directory);
  const path base = base_segment_path(config);

  const auto offsets = to_sample_offsets(boundaries, signal.sample_rate, signal.frames());

  render_summary summary;
  summary.candidates = offsets.size() < 2 ? 0 : offsets.size() - 1;

  for (std::size_t i = 0; i < summary.candidates; ++i) {
    auto segment = signal.slice(offsets[i], offsets[i + 1]);
    const double duration = segment.duration();

    if (duration < config.min_length) {
      println(cerr, "Warning: skipping segment {}: {:.3f}s is shorter than {:.3f}s",
              i + 1, duration, config.min_length);
      ++summary.skipped;
      continue;
    }

    segment = dsp.fade(segment, config.fade_duration_ms, config.curve);
    segment = dsp.filter(segment, config.filter_frequency, config.filter_kind);
    segment = dsp.normalise(segment, config.normalisation_level, config.normalisation);

    path out_path = base;
    out_path += std::format("_{}.wav", summary.written + 1);

    write_wav(segment, out_path, sample_format::Pcm24);
    stamp_metadata(out_path, metadata);

    ++summary.written;
    println(cout, "[{}/{}] {} ({:.3f}s)", i + 1, summary.candidates,
            out_path.generic_string(), duration);
    summary.files.push_back(std::move(out_path));
  }

  summary.metadata_file = export_metadata(metadata, base, "seg_metadata");

  if (config.save_text) export_boundaries(boundaries, config);

  println(cout, "Done: wrote {} of {} segments to {}", summary.written,
          summary.candidates, config.output_directory.generic_string());

  return summary;
}

path export_boundaries(boundary_set const &boundaries, segment_config const &config)
{
  const auto seconds = to_seconds(boundaries);

  create_directories(config.output_directory);
  path out_path = base_segment_path(config);
  out_path += "_segments.txt";

  std::ofstream out;
  out.exceptions(std::ofstream::failbit | std::ofstream::badbit);
  out.open(out_path, std::ios::binary | std::ios::trunc);

  std::size_t lines = 0;
  for (std::size_t i = 0; i + 1 < seconds.size(); ++i, ++lines)
    out << format_boundary_line(seconds[i], seconds[i + 1]);

  println(cout, "Wrote {} segment boundaries to {}", lines, out_path.generic_string());

  return out_path;
}

vector<path>
segment_using_text(path const &source, path const &text_file,
  path const &output_directory, segment_config const &config,
  conditioner const &dsp
) {
  // Every line is validated before the first file is written.
  const auto ranges = value_or_throw(read_boundary_text(text_file));
  const auto audio = value_or_throw(load_audio(source));

  create_directories(output_directory);

  vector<path> files;
  files.reserve(ranges.size());

  for (std::size_t i = 0; i < ranges.size(); ++i) {
    const std::size_t begin = time_to_sample(ranges[i].start_sec, audio.sample_rate);
    const std::size_t end   = time_to_sample(ranges[i].end_sec, audio.sample_rate);

    if (end > audio.frames()) {
      println(cerr, "Warning: segment {} ends after the recording ({:.3f}s > {:.3f}s)",
              i, ranges[i].end_sec, audio.duration());
    }

    const auto segment = dsp.fade(audio.slice(begin, end), config.fade_duration_ms, config.curve);

    path out_path = output_directory / std::format("segment_{}.wav", i);
    write_wav(segment, out_path, sample_format::Float);

    println(cout, "[{}/{}] {} ({:.3f}s)", i + 1, ranges.size(),
            out_path.generic_string(), segment.duration());
    files.push_back(std::move(out_path));
  }

  println(cout, "Done: wrote {} segments to {}", files.size(),
          output_directory.generic_string());

  return files;
}

segment_action prompt_action()
{
  println(cout, "1) Render segments");
  println(cout, "2) Export segments as text file");
  println(cout, "3) Exit");

  char *line = readline("Choose [1-3]: ");
  if (!line) return segment_action::Abort; // EOF (Ctrl-D)
  unique_ptr<char, decltype(&std::free)> guard(line, &std::free);

  const string_view answer = trim(line);
  if (auto action = parse_segment_action(answer)) return *action;

  println(cerr, "Unrecognised choice '{}'", answer);
  return segment_action::Abort;
}

action_provider default_action_provider(segment_config const &config)
{
  if (config.action) return [action = *config.action] { return action; };
  return &prompt_action;
}

segment_action
route_boundaries(interleaved<float> const &signal, boundary_set const &boundaries,
  segment_config const &config, metadata_record const &metadata,
  conditioner const &dsp, action_provider &provider
) {
  const segment_action action = provider();
  switch (action) {
    case segment_action::Render:
      render_segments(signal, boundaries, config, metadata, dsp);
      break;
    case segment_action::Export:
      export_boundaries(boundaries, config);
      break;
    case segment_action::Abort:
      println(cout, "Aborted, nothing written.");
      break;
  }
  return action;
}

void run(segment_config const &config, action_provider provider)
{
  const dsp_conditioner dsp;

  // Listed time ranges are sliced whichever output is chosen; only abort
  // changes the outcome.
  if (config.method == segmentation_method::Text) {
    if (provider() == segment_action::Abort) {
      println(cout, "Aborted, nothing written.");
      return;
    }
    segment_using_text(config.input_file, config.input_text,
                       config.output_directory, config, dsp);
    return;
  }

  const auto signal = value_or_throw(load_audio(config.input_file));
  println(cout, "Opened {} ({} Hz, {} ch, {:.2f}s)", config.input_file.generic_string(),
          signal.sample_rate, signal.channels(), signal.duration());

  const auto metadata = value_or_throw(extract_metadata(config.input_file, config));
  const auto analysis = value_or_throw(make_analysis_signal(signal, config.analysis));

  const analysis_settings settings =
    adjust_analysis_resolution(config.analysis, analysis.frames());
  if (settings.n_fft != config.analysis.n_fft) {
    println(cout, "Short signal: analysis window {} -> {}, hop {} -> {}",
            config.analysis.n_fft, settings.n_fft,
            config.analysis.hop_size, settings.hop_size);
  }

  const auto detector = make_detector(config.method, analysis, settings);
  const boundary_set boundaries = detector->detect();

  const std::size_t count = boundary_count(boundaries);
  println(cout, "{} detection: {} boundaries, {} candidate segments",
          to_string(config.method), count, count < 2 ? 0 : count - 1);

  route_boundaries(signal, boundaries, config, metadata, dsp, provider);
}

}
