#include "clseg/config.hpp"

#include <cmath>
#include <format>

#include <getopt.h>

#include "clseg/util.hpp"

namespace clseg {

namespace {

using std::expected, std::unexpected;
using std::filesystem::path;
using std::optional, std::nullopt;
using std::string, std::string_view;

enum long_only_option {
  OptNFft = 256,
  OptHopSize,
  OptOnsetThreshold,
  OptNoResolutionAdjustment
};

[[nodiscard]] string invalid(string_view option, string_view value, string_view why)
{ return std::format("Invalid --{} value '{}': {}", option, value, why); }

// Parse a number and check it against a predicate.
template<typename T, typename Pred>
[[nodiscard]] expected<T, string>
number_option(string_view option, const char *value, Pred &&valid, string_view requirement)
{
  auto v = parse_number<T>(value);
  if (!v) return unexpected(invalid(option, value, v.error()));
  if (!valid(*v)) return unexpected(invalid(option, value, requirement));
  return *v;
}

template<typename T>
[[nodiscard]] expected<T, string>
choice_option(string_view option, const char *value, optional<T> parsed)
{
  if (!parsed) return unexpected(invalid(option, value, "unknown choice"));
  return *parsed;
}

}

optional<segmentation_method> parse_segmentation_method(string_view name)
{
  if (name == "onset") return segmentation_method::Onset;
  if (name == "beat")  return segmentation_method::Beat;
  if (name == "text")  return segmentation_method::Text;
  return nullopt;
}

optional<segment_action> parse_segment_action(string_view name)
{
  if (name == "render" || name == "1") return segment_action::Render;
  if (name == "export" || name == "2") return segment_action::Export;
  if (name == "abort"  || name == "3") return segment_action::Abort;
  return nullopt;
}

string_view to_string(segmentation_method method) noexcept
{
  switch (method) {
    case segmentation_method::Onset: return "onset";
    case segmentation_method::Beat:  return "beat";
    case segmentation_method::Text:  return "text";
  }
  return "?";
}

path base_segment_path(segment_config const &config)
{
  const string name = config.input_file.filename().string();
  return config.output_directory / name.substr(0, name.find('.'));
}

expected<optional<segment_config>, string>
parse_options(int argc, char **argv)
{
  segment_config config;
  optional<path> output_directory;
  optional<path> input_text;

  static struct option long_options[] = {
    {"input-file",               required_argument, nullptr, 'i'},
    {"input-text",               required_argument, nullptr, 't'},
    {"output-directory",         required_argument, nullptr, 'o'},
    {"segmentation-method",      required_argument, nullptr, 'm'},
    {"save-txt",                 no_argument,       nullptr, 's'},
    {"min-length",               required_argument, nullptr, 'l'},
    {"fade-duration",            required_argument, nullptr, 'f'},
    {"curve-type",               required_argument, nullptr, 'c'},
    {"filter-frequency",         required_argument, nullptr, 'F'},
    {"filter-type",              required_argument, nullptr, 'T'},
    {"normalisation-level",      required_argument, nullptr, 'n'},
    {"normalisation-mode",       required_argument, nullptr, 'N'},
    {"sample-rate",              required_argument, nullptr, 'r'},
    {"action",                   required_argument, nullptr, 'a'},
    {"n-fft",                    required_argument, nullptr, OptNFft},
    {"hop-size",                 required_argument, nullptr, OptHopSize},
    {"onset-threshold",          required_argument, nullptr, OptOnsetThreshold},
    {"no-resolution-adjustment", no_argument,       nullptr, OptNoResolutionAdjustment},
    {"help",                     no_argument,       nullptr, 'h'},
    {nullptr,                    0,                 nullptr,  0 }
  };

  auto positive = [](auto v) { return v > 0; };
  auto non_negative = [](auto v) { return v >= 0; };

  // 0 makes glibc reinitialise its scanner, so repeated calls start clean.
  optind = 0;
  opterr = 0;
  int opt;
  int option_index = 0;
  while ((opt = getopt_long(argc, argv, ":i:t:o:m:sl:f:c:F:T:n:N:r:a:h",
                            long_options, &option_index)) != -1) {
    expected<void, string> ok;
    switch (opt) {
      case 'i':
        config.input_file = optarg;
        break;
      case 't':
        input_text = path(optarg);
        break;
      case 'o':
        output_directory = path(optarg);
        break;
      case 'm':
        ok = choice_option("segmentation-method", optarg, parse_segmentation_method(optarg))
          .transform([&](segmentation_method m) { config.method = m; });
        break;
      case 's':
        config.save_text = true;
        break;
      case 'l':
        ok = number_option<double>("min-length", optarg, non_negative, "must be >= 0")
          .transform([&](double v) { config.min_length = v; });
        break;
      case 'f':
        ok = number_option<int>("fade-duration", optarg, non_negative, "must be >= 0")
          .transform([&](int v) { config.fade_duration_ms = v; });
        break;
      case 'c':
        ok = choice_option("curve-type", optarg, parse_fade_curve(optarg))
          .transform([&](fade_curve c) { config.curve = c; });
        break;
      case 'F':
        ok = number_option<double>("filter-frequency", optarg, non_negative, "must be >= 0")
          .transform([&](double v) { config.filter_frequency = v; });
        break;
      case 'T':
        ok = choice_option("filter-type", optarg, parse_filter_type(optarg))
          .transform([&](filter_type t) { config.filter_kind = t; });
        break;
      case 'n':
        ok = number_option<double>("normalisation-level", optarg,
                                   [](double v) { return std::isfinite(v); }, "must be finite")
          .transform([&](double v) { config.normalisation_level = v; });
        break;
      case 'N':
        ok = choice_option("normalisation-mode", optarg, parse_normalisation_mode(optarg))
          .transform([&](normalisation_mode m) { config.normalisation = m; });
        break;
      case 'r':
        ok = number_option<std::uint32_t>("sample-rate", optarg, positive, "must be > 0")
          .transform([&](std::uint32_t v) { config.analysis.sample_rate = v; });
        break;
      case 'a':
        ok = choice_option("action", optarg, parse_segment_action(optarg))
          .transform([&](segment_action a) { config.action = a; });
        break;
      case OptNFft:
        ok = number_option<std::uint32_t>("n-fft", optarg, positive, "must be > 0")
          .transform([&](std::uint32_t v) { config.analysis.n_fft = v; });
        break;
      case OptHopSize:
        ok = number_option<std::uint32_t>("hop-size", optarg, positive, "must be > 0")
          .transform([&](std::uint32_t v) { config.analysis.hop_size = v; });
        break;
      case OptOnsetThreshold:
        ok = number_option<double>("onset-threshold", optarg, non_negative, "must be >= 0")
          .transform([&](double v) { config.analysis.onset_threshold = v; });
        break;
      case OptNoResolutionAdjustment:
        config.analysis.adjust_resolution = false;
        break;
      case 'h':
        return nullopt;
      case ':':
        return unexpected(std::format("Option '{}' requires a value", argv[optind - 1]));
      default:
        return unexpected(std::format("Unknown option '{}'", argv[optind - 1]));
    }
    if (!ok) return unexpected(ok.error());
  }

  if (optind < argc) {
    return unexpected(std::format("Unexpected argument '{}'", argv[optind]));
  }
  if (config.input_file.empty()) {
    return unexpected(string("Missing required --input-file"));
  }
  if (config.analysis.hop_size > config.analysis.n_fft) {
    return unexpected(std::format("--hop-size {} exceeds --n-fft {}",
                                  config.analysis.hop_size, config.analysis.n_fft));
  }

  path stem = config.input_file;
  stem.replace_extension();
  config.output_directory = output_directory.value_or(path(stem.string() + "_segments"));
  if (config.method == segmentation_method::Text) {
    config.input_text = input_text.value_or(path(stem.string() + ".txt"));
  }

  return config;
}

string usage(string_view program)
{
  return std::format(
    "Usage: {} -i <audio file> [options]\n"
    "Options:\n"
    "  -i, --input-file <file>          Audio file to segment (wav, aif, aiff, flac)\n"
    "  -t, --input-text <file>          Boundary text for -m text (default: <input>.txt)\n"
    "  -o, --output-directory <dir>     Output directory (default: <input>_segments)\n"
    "  -m, --segmentation-method <m>    onset | beat | text (default: onset)\n"
    "  -s, --save-txt                   Also write segment times when rendering\n"
    "  -l, --min-length <s>             Skip rendered segments shorter than this (default: 0.1)\n"
    "  -f, --fade-duration <ms>         Fade in/out duration (default: 20)\n"
    "  -c, --curve-type <c>             exp | log | linear | s_curve | hann (default: exp)\n"
    "  -F, --filter-frequency <Hz>      Filter cutoff, 0 disables (default: 40)\n"
    "  -T, --filter-type <t>            high | low (default: high)\n"
    "  -n, --normalisation-level <dB>   Target level (default: -3)\n"
    "  -N, --normalisation-mode <m>     peak | rms | loudness (default: peak)\n"
    "  -r, --sample-rate <Hz>           Analysis sample rate (default: 48000)\n"
    "      --n-fft <n>                  Analysis window size (default: 2048)\n"
    "      --hop-size <n>               Analysis hop size (default: 512)\n"
    "      --onset-threshold <x>        Onset peak-picking threshold (default: 0.1)\n"
    "      --no-resolution-adjustment   Keep window/hop size for short signals\n"
    "  -a, --action <a>                 render | export | abort instead of prompting\n"
    "  -h, --help                       Show this help\n",
    program
  );
}

}
