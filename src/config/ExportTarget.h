#pragma once

#include <QSize>
#include <QString>
#include <QStringList>

struct VideoCodecParams {
    QString codec = "libx264";
    QString preset = "fast";
    int crf = 23;               // quality factor 0..51
    int bitrateKbps = 5000;

    static const QStringList& supportedCodecs();
    static const QStringList& supportedPresets();
};

// Persisted and validated with the job; the published track itself is
// always AAC at 128 kbit/s.
struct AudioCodecParams {
    QString codec = "aac";
    int bitrateKbps = 128;
    int sampleRate = 44100;
    int channels = 2;

    static const QStringList& supportedCodecs();
};

// What the user asked for; the encoder actually used is resolved at runtime.
struct AccelerationPreference {
    bool enabled = true;
};

struct ExportTarget {
    int width = 1920;
    int height = 1080;
    int fps = 30;
    int threads = 0;            // 0 = let the encoder pick

    VideoCodecParams video;
    AudioCodecParams audio;
    AccelerationPreference acceleration;

    static constexpr int MaxDimension = 8192;
    static constexpr int MaxFps = 120;
    static constexpr int MaxThreads = 64;
    static constexpr int MaxCrf = 51;
    static constexpr int MaxAudioChannels = 8;

    QSize size() const { return QSize(width, height); }
    bool validate(QString* error = nullptr) const;
};
