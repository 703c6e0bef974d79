#include "clseg/audio.hpp"

#include <format>
#include <memory>
#include <stdexcept>
#include <utility>

#include <sndfile.hh>

#include <ebur128.h>
#include <samplerate.h>

namespace clseg {

namespace {

using std::ceil;
using std::expected, std::unexpected;
using std::filesystem::path;
using std::in_range;
using std::runtime_error;
using std::string;
using std::unique_ptr;

struct ebur128_state_deleter {
  void operator()(ebur128_state *p) const noexcept { if (p) ebur128_destroy(&p); }
};

using ebur128_state_ptr = unique_ptr<ebur128_state, ebur128_state_deleter>;

[[nodiscard]] int subtype(sample_format format) noexcept
{
  switch (format) {
    case sample_format::Pcm24: return SF_FORMAT_PCM_24;
    case sample_format::Float: return SF_FORMAT_FLOAT;
  }
  return SF_FORMAT_PCM_24;
}

}

expected<interleaved<float>, string>
load_audio(const path& file)
{
  SndfileHandle sf(file.string());
  if (sf.error()) {
    return unexpected("Failed to open audio file: " + file.generic_string());
  }

  const sf_count_t frames = sf.frames();
  const int sr = sf.samplerate();
  if (sr <= 0) {
    return unexpected("Invalid sample rate in file: " + file.generic_string());
  }
  if (sf.channels() <= 0) {
    return unexpected("Invalid channel count in file: " + file.generic_string());
  }

  interleaved<float> audio(
    static_cast<std::uint32_t>(sr),
    static_cast<std::size_t>(sf.channels()),
    static_cast<std::size_t>(frames)
  );

  const sf_count_t read_frames = sf.readf(audio.data(), frames);
  if (read_frames < 0) {
    return unexpected(
      "Failed to read audio data from file: " + file.generic_string()
    );
  }
  if (read_frames != frames) {
    audio.resize(static_cast<std::size_t>(read_frames));
  }

  return audio;
}

void write_wav(interleaved<float> const &audio, path const &out_path,
  sample_format format
) {
  if (!in_range<sf_count_t>(audio.frames()))
    throw runtime_error("frame count too large for libsndfile");

  const auto frames = sf_count_t(audio.frames());

  SndfileHandle sf(out_path.string(), SFM_WRITE,
    SF_FORMAT_WAV | subtype(format),
    int(audio.channels()), int(audio.sample_rate)
  );

  if (sf.error() != SF_ERR_NO_ERROR)
    throw runtime_error(out_path.generic_string() + ": " + sf.strError());

  // Fixed-point output saturates instead of wrapping.
  sf.command(SFC_SET_CLIPPING, nullptr, SF_TRUE);
  // The PEAK chunk carries a timestamp, which would make float output
  // differ between otherwise identical runs.
  sf.command(SFC_SET_ADD_PEAK_CHUNK, nullptr, SF_FALSE);

  const sf_count_t written = sf.writef(audio.data(), frames);
  if (written != frames)
    throw runtime_error(
      std::format("{}: short write: wrote {} of {} frames",
                  out_path.generic_string(), written, frames)
    );
}

interleaved<float> to_mono(interleaved<float> const &audio)
{
  interleaved<float> mono(audio.sample_rate, 1, audio.frames());
  for (std::size_t f = 0; f < audio.frames(); ++f) {
    mono[f, 0] = audio[f].average();
  }
  return mono;
}

expected<interleaved<float>, string>
resample(const interleaved<float>& in, std::uint32_t to_rate, int src_type)
{
  assert(in.sample_rate > 0);
  assert(to_rate > 0);

  if (in.sample_rate == to_rate || in.frames() == 0) {
    auto out = in.clone();
    out.sample_rate = to_rate;
    return out;
  }

  // libsamplerate constraints: still return error on overflow.
  if (!in_range<long>(in.frames()))
    return unexpected(
      "Input too large for libsamplerate (frame count exceeds 'long')."
    );

  const long in_frames = static_cast<long>(in.frames());
  const auto ratio = double(to_rate) / in.sample_rate;

  // Estimate output frames (add 1 for safety).
  const double est_out_frames_d = ceil(static_cast<double>(in_frames) * ratio) + 1.0;
  const auto   est_out_frames_sz = static_cast<std::size_t>(est_out_frames_d);

  if (!in_range<long>(est_out_frames_sz))
    return unexpected(
      "Output too large for libsamplerate (frame count exceeds 'long')."
    );

  const long out_frames_est = static_cast<long>(est_out_frames_d);

  if (!in_range<int>(in.channels()))
    return unexpected("Channel count too large for libsamplerate.");
  const auto ch = static_cast<int>(in.channels());

  interleaved<float> out(to_rate, in.channels(), static_cast<std::size_t>(out_frames_est));

  SRC_DATA data{
    .data_in       = in.data(),
    .data_out      = out.data(),
    .input_frames  = in_frames,
    .output_frames = out_frames_est,
    .end_of_input  = 1,
    .src_ratio     = ratio
  };

  if (const int err = src_simple(&data, src_type, ch); err != 0)
    return unexpected(src_strerror(err));

  out.resize(static_cast<std::size_t>(data.output_frames_gen));

  return out;
}

expected<double, string>
measure_lufs(const interleaved<float> &audio)
{
  ebur128_state_ptr state{
    ebur128_init(unsigned(audio.channels()), audio.sample_rate, EBUR128_MODE_I)
  };
  if (!state) return unexpected("measure_lufs: ebur128_init failed");

  if (ebur128_add_frames_float(state.get(), audio.data(), audio.frames())
      != EBUR128_SUCCESS)
    return unexpected("measure_lufs: ebur128_add_frames_float failed");

  double lufs = 0.0;
  if (ebur128_loudness_global(state.get(), &lufs) != EBUR128_SUCCESS)
    return unexpected("measure_lufs: ebur128_loudness_global failed");

  return lufs;
}

}
