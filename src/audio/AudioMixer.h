#pragma once

#include <cstdint>
#include "AudioBuffer.h"

namespace AudioMixer {
    // round(duration x rate)
    int64_t targetLength(double durationSeconds, int sampleRate);

    // Pads or truncates each present input to the target length, sums them and
    // scales the result so its peak sits at the headroom level. Returns an
    // absent buffer when both inputs are absent.
    AudioBuffer mix(const AudioBuffer& first, const AudioBuffer& second,
                    double durationSeconds, int sampleRate = AppConstants::AudioSampleRate);

    // Scales in place so the peak magnitude equals targetPeak; silence is left alone
    void normalize(std::vector<float>& samples, double targetPeak = AppConstants::MixHeadroomPeak);

    float peak(const std::vector<float>& samples);
}
