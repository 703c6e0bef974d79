#pragma once

#include <optional>
#include <string_view>

#include "clseg/audio.hpp"

namespace clseg {

// Fade curve for segment edges.
enum class fade_curve { Exponential, Logarithmic, Linear, SCurve, RaisedCosine };

enum class filter_type { High, Low };

enum class normalisation_mode { Peak, Rms, Loudness };

[[nodiscard]] std::optional<fade_curve> parse_fade_curve(std::string_view name);
[[nodiscard]] std::optional<filter_type> parse_filter_type(std::string_view name);
[[nodiscard]] std::optional<normalisation_mode> parse_normalisation_mode(std::string_view name);

[[nodiscard]] std::string_view to_string(fade_curve curve) noexcept;
[[nodiscard]] std::string_view to_string(filter_type type) noexcept;
[[nodiscard]] std::string_view to_string(normalisation_mode mode) noexcept;

// Map a normalized 0..1 position to a gain in 0..1 using the chosen curve.
[[nodiscard]] float apply_fade_curve(fade_curve curve, double x) noexcept;

// Fade in over the first and out over the last fade_ms milliseconds. Each
// ramp is limited to half the buffer.
[[nodiscard]] interleaved<float>
fade_io(interleaved<float> const &in, int fade_ms, fade_curve curve);

// Second-order Butterworth high- or low-pass. cutoff_hz <= 0 passes the
// signal through unchanged; a cutoff at or above Nyquist throws
// std::invalid_argument.
[[nodiscard]] interleaved<float>
filter(interleaved<float> const &in, double cutoff_hz, filter_type type);

// Scale to level_db: dBFS peak, dBFS RMS, or integrated LUFS. Silence, and
// buffers too short for a gated loudness measurement, are returned as is.
[[nodiscard]] interleaved<float>
normalise(interleaved<float> const &in, double level_db, normalisation_mode mode);

// The three conditioning stages behind one seam, so callers can substitute
// them.
class conditioner {
public:
  virtual ~conditioner() = default;

  [[nodiscard]] virtual interleaved<float>
  fade(interleaved<float> const &in, int fade_ms, fade_curve curve) const = 0;

  [[nodiscard]] virtual interleaved<float>
  filter(interleaved<float> const &in, double cutoff_hz, filter_type type) const = 0;

  [[nodiscard]] virtual interleaved<float>
  normalise(interleaved<float> const &in, double level_db, normalisation_mode mode) const = 0;
};

class dsp_conditioner final : public conditioner {
public:
  [[nodiscard]] interleaved<float>
  fade(interleaved<float> const &in, int fade_ms, fade_curve curve) const override
  { return fade_io(in, fade_ms, curve); }

  [[nodiscard]] interleaved<float>
  filter(interleaved<float> const &in, double cutoff_hz, filter_type type) const override
  { return clseg::filter(in, cutoff_hz, type); }

  [[nodiscard]] interleaved<float>
  normalise(interleaved<float> const &in, double level_db, normalisation_mode mode) const override
  { return clseg::normalise(in, level_db, mode); }
};

}
