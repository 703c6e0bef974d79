#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <numbers>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <sndfile.hh>

#include "clseg/audio.hpp"

namespace clseg::tests {

// Empty directory under the system temp dir, removed with its contents on
// destruction.
class temp_dir {
  std::filesystem::path path_;

public:
  explicit temp_dir(std::string_view tag)
  {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path()
          / std::format("clseg_{}_{:08x}", tag, rd());
    std::filesystem::create_directories(path_);
  }

  temp_dir(const temp_dir&) = delete;
  temp_dir& operator=(const temp_dir&) = delete;

  ~temp_dir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  [[nodiscard]] std::filesystem::path const &path() const noexcept { return path_; }
};

inline interleaved<float> make_sine(std::uint32_t sample_rate, std::size_t channels,
                                    std::size_t frames, double frequency, float amplitude)
{
  interleaved<float> audio(sample_rate, channels, frames);
  for (std::size_t f = 0; f < frames; ++f) {
    const auto v = amplitude * static_cast<float>(
      std::sin(2.0 * std::numbers::pi * frequency * double(f) / sample_rate));
    for (std::size_t ch = 0; ch < channels; ++ch) audio[f, ch] = v;
  }
  return audio;
}

inline interleaved<float> make_constant(std::uint32_t sample_rate, std::size_t channels,
                                        std::size_t frames, float value)
{
  interleaved<float> audio(sample_rate, channels, frames);
  for (std::size_t i = 0; i < audio.samples(); ++i) audio.data()[i] = value;
  return audio;
}

// Short decaying noise bursts every interval_sec on top of silence.
inline interleaved<float> make_click_track(std::uint32_t sample_rate, double seconds,
                                           double interval_sec)
{
  const auto frames = static_cast<std::size_t>(seconds * sample_rate);
  interleaved<float> audio(sample_rate, 1, frames);
  std::mt19937 rng(7);
  std::uniform_real_distribution<float> noise(-1.0f, 1.0f);
  const auto click_len = static_cast<std::size_t>(0.01 * sample_rate);
  for (double t = interval_sec / 2; t < seconds; t += interval_sec) {
    const auto start = static_cast<std::size_t>(t * sample_rate);
    for (std::size_t i = 0; i < click_len && start + i < frames; ++i) {
      const float env = std::exp(-5.0f * float(i) / float(click_len));
      audio[start + i, 0] = 0.9f * env * noise(rng);
    }
  }
  return audio;
}

inline std::string read_bytes(std::filesystem::path const &file)
{
  std::ifstream in(file, std::ios::binary);
  return { std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
}

inline void write_text(std::filesystem::path const &file, std::string_view text)
{
  std::ofstream out(file, std::ios::binary | std::ios::trunc);
  out << text;
}

inline std::size_t count_files(std::filesystem::path const &dir)
{
  if (!std::filesystem::exists(dir)) return 0;
  std::size_t n = 0;
  for (auto const &entry: std::filesystem::directory_iterator(dir))
    if (entry.is_regular_file()) ++n;
  return n;
}

inline sf_count_t file_frames(std::filesystem::path const &file)
{
  SndfileHandle sf(file.string());
  return sf.error() ? -1 : sf.frames();
}

inline int file_subtype(std::filesystem::path const &file)
{
  SndfileHandle sf(file.string());
  return sf.error() ? -1 : (sf.format() & SF_FORMAT_SUBMASK);
}

}
