#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <string>

#include "clseg/audio.hpp"
#include "clseg/boundaries.hpp"
#include "clseg/config.hpp"

namespace clseg {

class boundary_source {
public:
  virtual ~boundary_source() = default;

  // Boundaries in the unit the source declares.
  [[nodiscard]] virtual boundary_set detect() = 0;
};

// aubio onset or beat detection on a mono analysis signal. The result is
// frame indexed on the settings' grid, starts at frame 0 and ends at the
// first frame reaching the end of the signal.
class aubio_detector final : public boundary_source {
public:
  aubio_detector(segmentation_method method,
                 interleaved<float> const &analysis_signal,
                 analysis_settings const &settings);

  [[nodiscard]] boundary_set detect() override;

private:
  segmentation_method method_;
  interleaved<float> const &signal_;
  analysis_settings settings_;
};

// Halve window and hop together until the window fits a short signal.
// Returns the settings unchanged when adjustment is disabled or not needed.
[[nodiscard]] analysis_settings
adjust_analysis_resolution(analysis_settings const &settings, std::size_t num_samples);

// Mono mixdown resampled to the analysis rate.
[[nodiscard]] std::expected<interleaved<float>, std::string>
make_analysis_signal(interleaved<float> const &signal, analysis_settings const &settings);

[[nodiscard]] std::unique_ptr<boundary_source>
make_detector(segmentation_method method,
              interleaved<float> const &analysis_signal,
              analysis_settings const &settings);

}
