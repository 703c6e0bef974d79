#include "clseg/conditioning.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <iostream>
#include <numbers>
#include <print>
#include <stdexcept>
#include <utility>

#include "clseg/util.hpp"

namespace clseg {

namespace {

using std::cerr;
using std::clamp, std::min;
using std::optional, std::nullopt;
using std::println;
using std::string_view;

constexpr std::array fade_curve_names{
  std::pair{fade_curve::Exponential,  string_view("exp")},
  std::pair{fade_curve::Logarithmic,  string_view("log")},
  std::pair{fade_curve::Linear,       string_view("linear")},
  std::pair{fade_curve::SCurve,       string_view("s_curve")},
  std::pair{fade_curve::RaisedCosine, string_view("hann")}
};

constexpr std::array filter_type_names{
  std::pair{filter_type::High, string_view("high")},
  std::pair{filter_type::Low,  string_view("low")}
};

constexpr std::array normalisation_mode_names{
  std::pair{normalisation_mode::Peak,     string_view("peak")},
  std::pair{normalisation_mode::Rms,      string_view("rms")},
  std::pair{normalisation_mode::Loudness, string_view("loudness")}
};

template<typename Enum, std::size_t N>
[[nodiscard]] optional<Enum>
find_by_name(std::array<std::pair<Enum, string_view>, N> const &names, string_view name)
{
  for (auto const &[value, text]: names)
    if (text == name) return value;
  return nullopt;
}

template<typename Enum, std::size_t N>
[[nodiscard]] string_view
find_name(std::array<std::pair<Enum, string_view>, N> const &names, Enum value) noexcept
{
  for (auto const &[candidate, text]: names)
    if (candidate == value) return text;
  return "?";
}

struct biquad {
  double b0 = 1.0, b1 = 0.0, b2 = 0.0, a1 = 0.0, a2 = 0.0;

  // RBJ cookbook coefficients with Q = 1/sqrt(2) (Butterworth).
  static biquad butterworth(filter_type type, double cutoff_hz, double sample_rate)
  {
    const double w0 = 2.0 * std::numbers::pi * cutoff_hz / sample_rate;
    const double cosw = std::cos(w0);
    const double alpha = std::sin(w0) / std::numbers::sqrt2;
    const double a0 = 1.0 + alpha;

    biquad q;
    if (type == filter_type::Low) {
      q.b0 = (1.0 - cosw) / 2.0 / a0;
      q.b1 = (1.0 - cosw) / a0;
      q.b2 = q.b0;
    } else {
      q.b0 = (1.0 + cosw) / 2.0 / a0;
      q.b1 = -(1.0 + cosw) / a0;
      q.b2 = q.b0;
    }
    q.a1 = -2.0 * cosw / a0;
    q.a2 = (1.0 - alpha) / a0;
    return q;
  }
};

}

optional<fade_curve> parse_fade_curve(string_view name)
{ return find_by_name(fade_curve_names, name); }

optional<filter_type> parse_filter_type(string_view name)
{ return find_by_name(filter_type_names, name); }

optional<normalisation_mode> parse_normalisation_mode(string_view name)
{ return find_by_name(normalisation_mode_names, name); }

string_view to_string(fade_curve curve) noexcept
{ return find_name(fade_curve_names, curve); }

string_view to_string(filter_type type) noexcept
{ return find_name(filter_type_names, type); }

string_view to_string(normalisation_mode mode) noexcept
{ return find_name(normalisation_mode_names, mode); }

float apply_fade_curve(fade_curve curve, double x) noexcept
{
  x = clamp(x, 0.0, 1.0);
  switch (curve) {
    case fade_curve::Exponential:
      return static_cast<float>(std::expm1(3.0 * x) / std::expm1(3.0));

    case fade_curve::Logarithmic:
      return static_cast<float>(std::log10(1.0 + 9.0 * x));

    case fade_curve::Linear:
      return static_cast<float>(x);

    case fade_curve::SCurve:
      return static_cast<float>(x * x * (3.0 - 2.0 * x));

    case fade_curve::RaisedCosine:
      return static_cast<float>(0.5 - 0.5 * std::cos(std::numbers::pi * x));
  }
  return static_cast<float>(x); // fallback
}

interleaved<float>
fade_io(interleaved<float> const &in, int fade_ms, fade_curve curve)
{
  auto out = in.clone();
  if (fade_ms <= 0 || out.frames() == 0) return out;

  const auto requested = static_cast<std::size_t>(
    std::llround(double(fade_ms) * out.sample_rate / 1000.0)
  );
  const std::size_t length = min(requested, out.frames() / 2);
  if (length == 0) return out;

  const std::size_t last = out.frames() - 1;
  for (std::size_t i = 0; i < length; ++i) {
    const float gain = apply_fade_curve(curve, double(i) / double(length));
    out[i] *= gain;
    out[last - i] *= gain;
  }
  return out;
}

interleaved<float>
filter(interleaved<float> const &in, double cutoff_hz, filter_type type)
{
  auto out = in.clone();
  if (cutoff_hz <= 0.0 || out.frames() == 0) return out;

  if (cutoff_hz >= out.sample_rate / 2.0) {
    throw std::invalid_argument(std::format(
      "filter cutoff {} Hz must be below Nyquist ({} Hz)",
      cutoff_hz, out.sample_rate / 2.0
    ));
  }

  const auto q = biquad::butterworth(type, cutoff_hz, out.sample_rate);

  for (std::size_t ch = 0; ch < out.channels(); ++ch) {
    double x1 = 0.0, x2 = 0.0, y1 = 0.0, y2 = 0.0;
    for (std::size_t f = 0; f < out.frames(); ++f) {
      const double x0 = out[f, ch];
      const double y0 = q.b0 * x0 + q.b1 * x1 + q.b2 * x2 - q.a1 * y1 - q.a2 * y2;
      x2 = x1; x1 = x0;
      y2 = y1; y1 = y0;
      out[f, ch] = static_cast<float>(y0);
    }
  }
  return out;
}

interleaved<float>
normalise(interleaved<float> const &in, double level_db, normalisation_mode mode)
{
  auto out = in.clone();
  if (out.samples() == 0) return out;

  double gain = 1.0;
  switch (mode) {
    case normalisation_mode::Peak: {
      const double peak = out.peak();
      if (peak <= 0.0) return out;
      gain = dbamp(level_db) / peak;
      break;
    }

    case normalisation_mode::Rms: {
      double sum = 0.0;
      for (std::size_t i = 0; i < out.samples(); ++i)
        sum += double(out.data()[i]) * double(out.data()[i]);
      const double rms = std::sqrt(sum / double(out.samples()));
      if (rms <= 0.0) return out;
      gain = dbamp(level_db) / rms;
      break;
    }

    case normalisation_mode::Loudness: {
      auto lufs = measure_lufs(out);
      if (!lufs) throw std::runtime_error(lufs.error());
      if (!std::isfinite(*lufs)) {
        println(cerr, "Warning: loudness not measurable over {:.3f}s, level unchanged",
                out.duration());
        return out;
      }
      gain = dbamp(level_db - *lufs);
      break;
    }
  }

  out *= static_cast<float>(gain);
  return out;
}

}
