#pragma once

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace clseg {

template<typename T>
class interleaved {
  std::vector<T> storage;
  std::size_t frames_   = 0;
  std::size_t channels_ = 0;

public:
  std::uint32_t sample_rate = 0;

  interleaved() = default;

  interleaved(std::uint32_t sr, std::size_t ch, std::size_t frames)
  : storage(frames * ch), frames_(frames), channels_(ch), sample_rate(sr)
  { assert(ch > 0); }

  // move-only; use clone() for an explicit copy
  interleaved(const interleaved&) = delete;
  interleaved& operator=(const interleaved&) = delete;

  interleaved(interleaved&&) noexcept = default;
  interleaved& operator=(interleaved&&) noexcept = default;

  [[nodiscard]] std::size_t frames()   const noexcept { return frames_; }
  [[nodiscard]] double      duration() const noexcept { return double(frames()) / sample_rate; }
  [[nodiscard]] std::size_t channels() const noexcept { return channels_; }
  [[nodiscard]] std::size_t samples()  const noexcept { return storage.size(); }
  [[nodiscard]] T*          data()       noexcept     { return storage.data(); }
  [[nodiscard]] const T*    data() const noexcept     { return storage.data(); }

  template<typename Elem>
  class frame_view {
    std::span<Elem> row;

  public:
    frame_view(Elem* row, std::size_t ch) : row(row, ch) {}

    [[nodiscard]] T average() const noexcept {
      return std::ranges::fold_left(row, T(0), std::plus<T>{}) / row.size();
    }

    frame_view& operator*=(T gain) noexcept
    {
      for (T &sample: row) sample *= gain;
      return *this;
    }
  };

  T& operator[](std::size_t frame, std::size_t ch) noexcept {
    assert(frame < frames_ && ch < channels_);
    return storage[frame * channels_ + ch];
  }
  const T& operator[](std::size_t frame, std::size_t ch) const noexcept
  {
    assert(frame < frames_ && ch < channels_);
    return storage[frame * channels_ + ch];
  }

  frame_view<T> operator[](std::size_t frame) noexcept
  {
    assert(frame < frames_);
    return { storage.data() + frame * channels_, channels_ };
  }
  const frame_view<const T> operator[](std::size_t frame) const noexcept
  {
    assert(frame < frames_);
    return { storage.data() + frame * channels_, channels_ };
  }

  [[nodiscard]] T peak() const noexcept
  {
    T result(0);
    for (T v: storage) result = std::max(result, std::abs(v));
    return result;
  }

  [[nodiscard]] interleaved clone() const
  {
    interleaved copy(sample_rate, channels_, frames_);
    std::ranges::copy(storage, copy.storage.begin());
    return copy;
  }

  // Frames [begin, end) as a new buffer. Out-of-range bounds are clamped.
  [[nodiscard]] interleaved slice(std::size_t begin, std::size_t end) const
  {
    end = std::min(end, frames_);
    begin = std::min(begin, end);
    interleaved part(sample_rate, channels_, end - begin);
    std::copy(storage.begin() + std::ptrdiff_t(begin * channels_),
              storage.begin() + std::ptrdiff_t(end * channels_),
              part.storage.begin());
    return part;
  }

  void resize(std::size_t new_frames)
  {
    storage.resize(new_frames * channels_);
    frames_ = new_frames;
  }

  // Scale all samples in-place by gain.
  interleaved &operator*=(T gain) noexcept
  {
    for (T &sample: storage) sample *= gain;
    return *this;
  }
};

// libsndfile encodings this tool writes.
enum class sample_format { Pcm24, Float };

[[nodiscard]] std::expected<interleaved<float>, std::string>
load_audio(const std::filesystem::path& file);

// Throws std::runtime_error on open failure or short write.
void write_wav(interleaved<float> const &audio,
  std::filesystem::path const &out_path, sample_format format
);

// Channel average, same sample rate.
[[nodiscard]] interleaved<float> to_mono(interleaved<float> const &audio);

[[nodiscard]] std::expected<interleaved<float>, std::string>
resample(const interleaved<float>& in, std::uint32_t to_rate, int src_type);

[[nodiscard]] std::expected<double, std::string>
measure_lufs(const interleaved<float> &audio);

}
