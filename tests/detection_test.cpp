#include "clseg/detection.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <variant>

#include "test_utils.hpp"

namespace {

using clseg::analysis_settings;
using clseg::segmentation_method;

bool test_resolution_adjustment() {
    const analysis_settings settings;

    const auto unchanged = clseg::adjust_analysis_resolution(settings, 48000);
    if (unchanged.n_fft != 2048 || unchanged.hop_size != 512) {
        std::cerr << "detection_test: long signals must keep their analysis window.\n";
        return false;
    }

    const auto halved = clseg::adjust_analysis_resolution(settings, 1000);
    if (halved.n_fft != 512 || halved.hop_size != 128) {
        std::cerr << "detection_test: expected 512 / 128 for 1000 samples, got "
                  << halved.n_fft << " / " << halved.hop_size << ".\n";
        return false;
    }

    const auto floor = clseg::adjust_analysis_resolution(settings, 10);
    if (floor.n_fft != 64 || floor.hop_size != 16) {
        std::cerr << "detection_test: window must not shrink below 64.\n";
        return false;
    }

    analysis_settings fixed = settings;
    fixed.adjust_resolution = false;
    const auto kept = clseg::adjust_analysis_resolution(fixed, 1000);
    if (kept.n_fft != 2048 || kept.hop_size != 512) {
        std::cerr << "detection_test: disabled adjustment must keep the settings.\n";
        return false;
    }
    if (settings.n_fft != 2048) {
        std::cerr << "detection_test: adjustment must not touch its input.\n";
        return false;
    }
    return true;
}

bool test_analysis_signal() {
    const auto stereo = clseg::tests::make_sine(44100, 2, 44100, 440.0, 0.5f);
    const auto analysis = clseg::make_analysis_signal(stereo, analysis_settings{});
    if (!analysis) {
        std::cerr << "detection_test: resample failed: " << analysis.error() << "\n";
        return false;
    }
    if (analysis->channels() != 1 || analysis->sample_rate != 48000
        || std::abs(double(analysis->frames()) - 48000.0) > 2.0) {
        std::cerr << "detection_test: analysis signal must be mono at 48 kHz.\n";
        return false;
    }
    return true;
}

bool check_tiling(clseg::boundary_set const &set, clseg::interleaved<float> const &signal,
                  analysis_settings const &settings, const char *label) {
    const auto *frames = std::get_if<clseg::frame_boundaries>(&set);
    if (!frames) {
        std::cerr << "detection_test: " << label << " must yield frame boundaries.\n";
        return false;
    }
    if (frames->grid.hop_size != settings.hop_size || frames->grid.n_fft != settings.n_fft
        || frames->grid.sample_rate != signal.sample_rate) {
        std::cerr << "detection_test: " << label << " grid does not match the analysis.\n";
        return false;
    }
    const auto end_frame = static_cast<std::size_t>(
        std::ceil(double(signal.frames()) / settings.hop_size));
    if (frames->frames.size() < 2 || frames->frames.front() != 0
        || frames->frames.back() != end_frame) {
        std::cerr << "detection_test: " << label << " boundaries must span the signal.\n";
        return false;
    }
    for (std::size_t i = 1; i < frames->frames.size(); ++i) {
        if (frames->frames[i] <= frames->frames[i - 1]) {
            std::cerr << "detection_test: " << label << " boundaries not increasing.\n";
            return false;
        }
    }
    const auto offsets = clseg::to_sample_offsets(set, signal.sample_rate, signal.frames());
    if (offsets.back() != signal.frames()) {
        std::cerr << "detection_test: " << label << " last offset must be the signal end.\n";
        return false;
    }
    const auto seconds = clseg::to_seconds(set);
    if (seconds.back() > signal.duration()) {
        std::cerr << "detection_test: " << label << " ends at " << seconds.back()
                  << "s, past the " << signal.duration() << "s signal.\n";
        return false;
    }
    return true;
}

bool test_onset_detection() {
    const auto clicks = clseg::tests::make_click_track(48000, 4.0, 0.5);
    const analysis_settings settings;
    clseg::aubio_detector detector(segmentation_method::Onset, clicks, settings);
    const auto set = detector.detect();
    if (!check_tiling(set, clicks, settings, "onset")) {
        return false;
    }
    if (clseg::boundary_count(set) < 4) {
        std::cerr << "detection_test: too few onsets found in a click track.\n";
        return false;
    }
    return true;
}

bool test_beat_detection() {
    const auto clicks = clseg::tests::make_click_track(48000, 6.0, 0.5);
    const analysis_settings settings;
    const auto detector = clseg::make_detector(segmentation_method::Beat, clicks, settings);
    return check_tiling(detector->detect(), clicks, settings, "beat");
}

bool test_invalid_detector_use() {
    const auto clicks = clseg::tests::make_click_track(48000, 1.0, 0.5);
    try {
        clseg::aubio_detector detector(segmentation_method::Text, clicks, analysis_settings{});
        std::cerr << "detection_test: text method has no detector.\n";
        return false;
    } catch (const std::invalid_argument &) {
    }

    const clseg::interleaved<float> empty(48000, 1, 0);
    clseg::aubio_detector detector(segmentation_method::Onset, empty, analysis_settings{});
    try {
        (void)detector.detect();
        std::cerr << "detection_test: empty signal must be rejected.\n";
        return false;
    } catch (const std::invalid_argument &) {
    }
    return true;
}

} // namespace

int main() {
    if (!test_resolution_adjustment()) {
        return 1;
    }
    if (!test_analysis_signal()) {
        return 1;
    }
    if (!test_onset_detection()) {
        return 1;
    }
    if (!test_beat_detection()) {
        return 1;
    }
    if (!test_invalid_detector_use()) {
        return 1;
    }
    std::cout << "Detection test passed.\n";
    return 0;
}
