#include "clseg/detection.hpp"

#include <algorithm>
#include <cmath>
#include <ranges>
#include <stdexcept>
#include <vector>

#include <aubio/aubio.h>
#include <samplerate.h>

namespace clseg {

namespace {

using std::max;
using std::runtime_error;
using std::unique_ptr;
using std::vector;
namespace ranges { using namespace std::ranges; }
namespace views { using namespace std::views; }

using aubio_tempo_ptr = unique_ptr<aubio_tempo_t, decltype(&del_aubio_tempo)>;
using aubio_onset_ptr = unique_ptr<aubio_onset_t, decltype(&del_aubio_onset)>;
using fvec_ptr        = unique_ptr<fvec_t,        decltype(&del_fvec)>;

template<typename F> void
for_each_mono_chunk(interleaved<float> const &audio, fvec_t *buffer, F &&f)
{
  auto mono = [&audio](std::size_t frame) { return audio[frame].average(); };
  for (auto frames: views::chunk(views::iota(std::size_t(0), audio.frames()), buffer->length)) {
    smpl_t *tail = ranges::transform(frames, buffer->data, mono).out;
    std::fill(tail, buffer->data + buffer->length, smpl_t(0));
    f(buffer);
  }
}

// Sample positions of detected onsets, already compensated for the
// detection delay by aubio.
[[nodiscard]] vector<double>
detect_onsets(interleaved<float> const &track, analysis_settings const &settings)
{
  const uint_t win_s = settings.n_fft;
  const uint_t hop_s = settings.hop_size;
  const auto samplerate = static_cast<uint_t>(track.sample_rate);

  aubio_onset_ptr onset{
    new_aubio_onset("default", win_s, hop_s, samplerate), &del_aubio_onset
  };
  if (!onset) throw runtime_error("aubio: failed to create onset object");

  if (aubio_onset_set_threshold(onset.get(), smpl_t(settings.onset_threshold)) != 0)
    throw runtime_error("aubio: invalid onset threshold");

  fvec_ptr inbuf{ new_fvec(hop_s), &del_fvec };
  fvec_ptr outbuf{ new_fvec(1), &del_fvec };
  if (!inbuf || !outbuf) {
    throw runtime_error("aubio: failed to allocate onset buffers");
  }

  vector<double> result;

  for_each_mono_chunk(track, inbuf.get(), [&](fvec_t *buffer) {
    aubio_onset_do(onset.get(), buffer, outbuf.get());

    // onset detected in this hop?
    if (fvec_get_sample(outbuf.get(), 0) != smpl_t(0)) {
      result.push_back(double(aubio_onset_get_last(onset.get())));
    }
  });

  return result;
}

// Sample positions of tracked beats.
[[nodiscard]] vector<double>
detect_beats(interleaved<float> const &track, analysis_settings const &settings)
{
  const uint_t win_s = settings.n_fft;
  const uint_t hop_s = settings.hop_size;
  const auto samplerate = static_cast<uint_t>(track.sample_rate);

  aubio_tempo_ptr tempo{
    new_aubio_tempo("default", win_s, hop_s, samplerate), &del_aubio_tempo
  };
  if (!tempo) throw runtime_error("aubio: failed to create tempo object");

  fvec_ptr tempo_out{ new_fvec(2), &del_fvec };
  fvec_ptr inbuf    { new_fvec(hop_s), &del_fvec };
  if (!inbuf || !tempo_out) {
    throw runtime_error("aubio: failed to allocate tempo buffers");
  }

  vector<double> result;

  for_each_mono_chunk(track, inbuf.get(), [&](fvec_t *buffer) {
    aubio_tempo_do(tempo.get(), buffer, tempo_out.get());

    // Beat detected in this hop?
    if (fvec_get_sample(tempo_out.get(), 0) != smpl_t(0)) {
      result.push_back(double(aubio_tempo_get_last(tempo.get())));
    }
  });

  return result;
}

}

aubio_detector::aubio_detector(segmentation_method method,
                               interleaved<float> const &analysis_signal,
                               analysis_settings const &settings)
: method_(method), signal_(analysis_signal), settings_(settings)
{
  if (method_ == segmentation_method::Text)
    throw std::invalid_argument("aubio_detector: text segmentation has no detector");
  if (settings_.hop_size == 0 || settings_.n_fft < settings_.hop_size)
    throw std::invalid_argument("aubio_detector: hop size must be in [1, n_fft]");
}

boundary_set aubio_detector::detect()
{
  if (signal_.sample_rate == 0 || signal_.channels() == 0 || signal_.frames() == 0) {
    throw std::invalid_argument("detect: invalid or empty analysis signal");
  }

  const analysis_grid grid{
    .hop_size    = settings_.hop_size,
    .n_fft       = settings_.n_fft,
    .sample_rate = signal_.sample_rate
  };

  const vector<double> positions = (method_ == segmentation_method::Beat)
    ? detect_beats(signal_, settings_) : detect_onsets(signal_, settings_);

  // First frame whose position reaches the end of the signal.
  const auto end_frame = static_cast<std::size_t>(
    std::ceil(double(signal_.frames()) / grid.hop_size)
  );

  frame_boundaries boundaries{
    .frames = {0}, .grid = grid, .signal_length = signal_.frames()
  };
  for (double position: positions) {
    const std::size_t frame = grid.sample_to_frame(position);
    if (frame > 0 && frame < end_frame) boundaries.frames.push_back(frame);
  }
  if (end_frame > 0) boundaries.frames.push_back(end_frame);

  ranges::sort(boundaries.frames);
  boundaries.frames.erase(
    std::unique(boundaries.frames.begin(), boundaries.frames.end()),
    boundaries.frames.end()
  );

  return boundaries;
}

analysis_settings
adjust_analysis_resolution(analysis_settings const &settings, std::size_t num_samples)
{
  analysis_settings adjusted = settings;
  if (!settings.adjust_resolution) return adjusted;

  constexpr std::uint32_t min_n_fft = 64;
  while (adjusted.n_fft > num_samples && adjusted.n_fft / 2 >= min_n_fft) {
    adjusted.n_fft /= 2;
    adjusted.hop_size = max(1u, adjusted.hop_size / 2);
  }
  return adjusted;
}

std::expected<interleaved<float>, std::string>
make_analysis_signal(interleaved<float> const &signal, analysis_settings const &settings)
{
  return resample(to_mono(signal), settings.sample_rate, SRC_SINC_FASTEST);
}

std::unique_ptr<boundary_source>
make_detector(segmentation_method method,
              interleaved<float> const &analysis_signal,
              analysis_settings const &settings)
{
  return std::make_unique<aubio_detector>(method, analysis_signal, settings);
}

}
