#pragma once

#include <utility>
#include <vector>
#include "AppConstants.h"

// Mono float samples. An absent buffer stands for "no audio from this source".
struct AudioBuffer {
    bool present = false;
    int sampleRate = AppConstants::AudioSampleRate;
    std::vector<float> samples;

    static AudioBuffer absent() { return AudioBuffer{}; }
    static AudioBuffer fromSamples(std::vector<float> data, int rate = AppConstants::AudioSampleRate) {
        AudioBuffer buffer;
        buffer.present = true;
        buffer.sampleRate = rate;
        buffer.samples = std::move(data);
        return buffer;
    }

    double duration() const {
        return sampleRate > 0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }
};
