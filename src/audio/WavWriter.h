#pragma once

#include <QString>
#include <vector>

namespace WavWriter {
    // 16-bit PCM mono RIFF/WAVE. Samples are clipped to [-1, 1].
    bool writeMono16(const QString& filePath, const std::vector<float>& samples,
                     int sampleRate, QString* error = nullptr);
}
