#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include "SourceFrame.h"

struct VideoInfo {
    int width = 0;
    int height = 0;
    double fps = 0.0;
    double duration = 0.0;  // seconds
    int64_t totalFrames = 0;
    QString codecName;
};

// Sequential frame reader for one speaker stream. Decoders are stateful, so a
// reader must only be driven from one thread.
class VideoDecoder : public QObject {
    Q_OBJECT
public:
    explicit VideoDecoder(QObject* parent = nullptr);
    ~VideoDecoder();

    bool open(const QString& filePath);
    void close();
    bool isOpen() const { return m_isOpen; }

    SourceFrame readFrame();
    bool isExhausted() const { return m_exhausted; }
    double currentTime() const { return m_currentTime; }

    const VideoInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

private:
    bool fail(const QString& message);
    QImage convertCurrentFrame();

    bool m_isOpen = false;
    bool m_exhausted = false;
    double m_currentTime = 0.0;
    VideoInfo m_info;
    QString m_error;

    struct FFmpegContext;
    std::unique_ptr<FFmpegContext> m_ctx;
};
