#include "WavWriter.h"
#include <QDataStream>
#include <QSaveFile>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace WavWriter {

bool writeMono16(const QString& filePath, const std::vector<float>& samples,
                 int sampleRate, QString* error) {
    constexpr quint16 channels = 1;
    constexpr quint16 bitsPerSample = 16;
    constexpr quint16 blockAlign = channels * bitsPerSample / 8;

    const quint64 dataBytes = static_cast<quint64>(samples.size()) * blockAlign;
    if (dataBytes > 0xFFFFFFFFull - 36) {
        if (error) *error = "Audio is too long for a WAV file";
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) *error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }

    QDataStream out(&file);
    out.setByteOrder(QDataStream::LittleEndian);

    out.writeRawData("RIFF", 4);
    out << static_cast<quint32>(36 + dataBytes);
    out.writeRawData("WAVE", 4);

    out.writeRawData("fmt ", 4);
    out << static_cast<quint32>(16);                    // PCM header size
    out << static_cast<quint16>(1);                     // PCM
    out << channels;
    out << static_cast<quint32>(sampleRate);
    out << static_cast<quint32>(sampleRate * blockAlign);
    out << blockAlign;
    out << bitsPerSample;

    out.writeRawData("data", 4);
    out << static_cast<quint32>(dataBytes);

    for (float s : samples) {
        float clipped = std::clamp(s, -1.0f, 1.0f);
        out << static_cast<qint16>(std::lround(clipped * 32767.0f));
    }

    if (out.status() != QDataStream::Ok || !file.commit()) {
        if (error) *error = QString("Failed writing WAV data to: %1").arg(filePath);
        return false;
    }
    return true;
}

} // namespace WavWriter
