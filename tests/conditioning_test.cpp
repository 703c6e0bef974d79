#include "clseg/conditioning.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

#include "clseg/util.hpp"
#include "test_utils.hpp"

namespace {

using clseg::fade_curve;
using clseg::filter_type;
using clseg::normalisation_mode;
using clseg::tests::make_constant;
using clseg::tests::make_sine;

double rms(clseg::interleaved<float> const &audio) {
    double sum = 0.0;
    for (std::size_t i = 0; i < audio.samples(); ++i) {
        sum += double(audio.data()[i]) * double(audio.data()[i]);
    }
    return std::sqrt(sum / double(audio.samples()));
}

bool test_curve_endpoints() {
    for (auto curve : {fade_curve::Exponential, fade_curve::Logarithmic, fade_curve::Linear,
                       fade_curve::SCurve, fade_curve::RaisedCosine}) {
        const float start = clseg::apply_fade_curve(curve, 0.0);
        const float mid = clseg::apply_fade_curve(curve, 0.5);
        const float end = clseg::apply_fade_curve(curve, 1.0);
        if (std::abs(start) > 1e-6f || std::abs(end - 1.0f) > 1e-6f) {
            std::cerr << "conditioning_test: curve " << clseg::to_string(curve)
                      << " must run from 0 to 1.\n";
            return false;
        }
        if (!(mid > start && mid < end)) {
            std::cerr << "conditioning_test: curve " << clseg::to_string(curve)
                      << " is not increasing.\n";
            return false;
        }
    }
    return true;
}

bool test_curve_names() {
    if (clseg::parse_fade_curve("hann") != fade_curve::RaisedCosine
        || clseg::parse_fade_curve("s_curve") != fade_curve::SCurve
        || clseg::parse_fade_curve("cubic").has_value()) {
        std::cerr << "conditioning_test: fade curve names mismatch.\n";
        return false;
    }
    if (clseg::parse_filter_type("low") != filter_type::Low
        || clseg::parse_normalisation_mode("loudness") != normalisation_mode::Loudness
        || clseg::to_string(normalisation_mode::Rms) != "rms") {
        std::cerr << "conditioning_test: filter / normalisation names mismatch.\n";
        return false;
    }
    return true;
}

bool test_fade_edges() {
    const auto in = make_constant(48000, 2, 48000, 1.0f);
    const auto out = clseg::fade_io(in, 20, fade_curve::Linear);
    const std::size_t last = out.frames() - 1;

    if (out[0, 0] != 0.0f || out[0, 1] != 0.0f || out[last, 0] != 0.0f || out[last, 1] != 0.0f) {
        std::cerr << "conditioning_test: faded edges must start and end at zero.\n";
        return false;
    }
    // 20 ms at 48 kHz is 960 frames.
    if (std::abs(out[480, 0] - 0.5f) > 1e-6f) {
        std::cerr << "conditioning_test: linear fade midpoint should be 0.5.\n";
        return false;
    }
    if (out[960, 0] != 1.0f || out[24000, 1] != 1.0f || out[last - 960, 0] != 1.0f) {
        std::cerr << "conditioning_test: samples outside the fades must be untouched.\n";
        return false;
    }
    if (in[0, 0] != 1.0f) {
        std::cerr << "conditioning_test: fade must not modify its input.\n";
        return false;
    }
    return true;
}

bool test_fade_limited_to_half() {
    const auto in = make_constant(48000, 1, 100, 1.0f);
    const auto out = clseg::fade_io(in, 20, fade_curve::Exponential);
    if (out[0, 0] != 0.0f || out[99, 0] != 0.0f) {
        std::cerr << "conditioning_test: short buffer edges must still reach zero.\n";
        return false;
    }
    for (std::size_t f = 0; f < out.frames(); ++f) {
        if (out[f, 0] < 0.0f || out[f, 0] > 1.0f) {
            std::cerr << "conditioning_test: overlapping fades must not overshoot.\n";
            return false;
        }
    }

    const auto untouched = clseg::fade_io(in, 0, fade_curve::Exponential);
    if (untouched[0, 0] != 1.0f) {
        std::cerr << "conditioning_test: fade of 0 ms must be a no-op.\n";
        return false;
    }
    return true;
}

bool test_filter_passthrough() {
    const auto in = make_sine(44100, 2, 4410, 440.0, 0.5f);
    const auto out = clseg::filter(in, 0.0, filter_type::High);
    for (std::size_t i = 0; i < in.samples(); ++i) {
        if (out.data()[i] != in.data()[i]) {
            std::cerr << "conditioning_test: cutoff 0 must pass the signal through.\n";
            return false;
        }
    }
    return true;
}

bool test_highpass_removes_dc() {
    const auto in = make_constant(48000, 1, 48000, 0.5f);
    const auto out = clseg::filter(in, 40.0, filter_type::High);
    for (std::size_t f = out.frames() - 1000; f < out.frames(); ++f) {
        if (std::abs(out[f, 0]) > 1e-3f) {
            std::cerr << "conditioning_test: high-pass left DC at frame " << f << ".\n";
            return false;
        }
    }
    return true;
}

bool test_lowpass_attenuates_highs() {
    const auto in = make_sine(48000, 1, 48000, 10000.0, 0.5f);
    const auto out = clseg::filter(in, 100.0, filter_type::Low);
    float peak = 0.0f;
    for (std::size_t f = out.frames() / 2; f < out.frames(); ++f) {
        peak = std::max(peak, std::abs(out[f, 0]));
    }
    if (peak > 0.01f) {
        std::cerr << "conditioning_test: low-pass left 10 kHz at peak " << peak << ".\n";
        return false;
    }
    return true;
}

bool test_filter_rejects_nyquist() {
    const auto in = make_sine(48000, 1, 480, 440.0, 0.5f);
    try {
        (void)clseg::filter(in, 24000.0, filter_type::Low);
    } catch (const std::invalid_argument &) {
        return true;
    }
    std::cerr << "conditioning_test: cutoff at Nyquist must throw.\n";
    return false;
}

bool test_peak_normalise() {
    const auto in = make_sine(48000, 2, 48000, 100.0, 0.25f);
    const auto out = clseg::normalise(in, -3.0, normalisation_mode::Peak);
    if (std::abs(out.peak() - clseg::dbamp(-3.0f)) > 1e-4f) {
        std::cerr << "conditioning_test: peak " << out.peak() << " is not -3 dBFS.\n";
        return false;
    }
    return true;
}

bool test_rms_normalise() {
    const auto in = make_sine(48000, 1, 48000, 100.0, 0.5f);
    const auto out = clseg::normalise(in, -12.0, normalisation_mode::Rms);
    if (std::abs(rms(out) - clseg::dbamp(-12.0)) > 1e-3) {
        std::cerr << "conditioning_test: RMS " << rms(out) << " is not -12 dBFS.\n";
        return false;
    }
    return true;
}

bool test_loudness_normalise() {
    const auto in = make_sine(48000, 2, 3 * 48000, 1000.0, 0.1f);
    const auto out = clseg::normalise(in, -23.0, normalisation_mode::Loudness);
    const auto lufs = clseg::measure_lufs(out);
    if (!lufs || std::abs(*lufs + 23.0) > 0.1) {
        std::cerr << "conditioning_test: loudness normalisation missed -23 LUFS.\n";
        return false;
    }
    return true;
}

bool test_silence_unchanged() {
    const auto in = make_constant(48000, 1, 4800, 0.0f);
    for (auto mode : {normalisation_mode::Peak, normalisation_mode::Rms, normalisation_mode::Loudness}) {
        const auto out = clseg::normalise(in, -3.0, mode);
        if (out.peak() != 0.0f) {
            std::cerr << "conditioning_test: silence must stay silent in mode "
                      << clseg::to_string(mode) << ".\n";
            return false;
        }
    }
    return true;
}

} // namespace

int main() {
    if (!test_curve_endpoints()) {
        return 1;
    }
    if (!test_curve_names()) {
        return 1;
    }
    if (!test_fade_edges()) {
        return 1;
    }
    if (!test_fade_limited_to_half()) {
        return 1;
    }
    if (!test_filter_passthrough()) {
        return 1;
    }
    if (!test_highpass_removes_dc()) {
        return 1;
    }
    if (!test_lowpass_attenuates_highs()) {
        return 1;
    }
    if (!test_filter_rejects_nyquist()) {
        return 1;
    }
    if (!test_peak_normalise()) {
        return 1;
    }
    if (!test_rms_normalise()) {
        return 1;
    }
    if (!test_loudness_normalise()) {
        return 1;
    }
    if (!test_silence_unchanged()) {
        return 1;
    }
    std::cout << "Conditioning test passed.\n";
    return 0;
}
