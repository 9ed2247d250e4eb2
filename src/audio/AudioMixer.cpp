#include "AudioMixer.h"
#include <algorithm>
#include <cmath>

namespace AudioMixer {

int64_t targetLength(double durationSeconds, int sampleRate) {
    if (durationSeconds <= 0.0 || sampleRate <= 0) return 0;
    return std::llround(durationSeconds * sampleRate);
}

float peak(const std::vector<float>& samples) {
    float maxAmplitude = 0.0f;
    for (float s : samples)
        maxAmplitude = std::max(maxAmplitude, std::fabs(s));
    return maxAmplitude;
}

void normalize(std::vector<float>& samples, double targetPeak) {
    float maxAmplitude = peak(samples);
    if (maxAmplitude <= 0.0f) return;

    double gain = targetPeak / maxAmplitude;
    for (float& s : samples)
        s = static_cast<float>(s * gain);
}

AudioBuffer mix(const AudioBuffer& first, const AudioBuffer& second,
                double durationSeconds, int sampleRate) {
    if (!first.present && !second.present) return AudioBuffer::absent();

    const size_t length = static_cast<size_t>(targetLength(durationSeconds, sampleRate));
    std::vector<float> mixed(length, 0.0f);

    for (const AudioBuffer* input : { &first, &second }) {
        if (!input->present) continue;
        // Zero padding is implicit: samples past the input's end add nothing
        const size_t count = std::min(length, input->samples.size());
        for (size_t i = 0; i < count; ++i)
            mixed[i] += input->samples[i];
    }

    normalize(mixed);
    return AudioBuffer::fromSamples(std::move(mixed), sampleRate);
}

} // namespace AudioMixer
