#pragma once

#include <QObject>
#include <QString>

// Stream inventory of a media file. Only the best audio stream is described
// since the composer never needs more.
struct MediaInfo {
    QString containerFormat;
    double duration = 0.0;
    int videoStreams = 0;
    int audioStreams = 0;

    int audioSampleRate = 0;
    int audioChannels = 0;
    QString audioCodec;

    bool hasVideo() const { return videoStreams > 0; }
    bool hasAudio() const { return audioStreams > 0; }

    // e.g. "aac, 48000 Hz, 2 ch"
    QString audioSummary() const;
};

class MediaProbe : public QObject {
    Q_OBJECT
public:
    explicit MediaProbe(QObject* parent = nullptr);
    ~MediaProbe();

    // Reads container headers only; no decoder is opened
    bool probe(const QString& filePath);
    const MediaInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

private:
    MediaInfo m_info;
    QString m_error;
};
