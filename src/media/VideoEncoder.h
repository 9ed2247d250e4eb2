#pragma once

#include <QObject>
#include <QImage>
#include <QString>
#include <memory>

struct VideoEncoderSettings {
    int width = 0;
    int height = 0;
    double fps = 30.0;
    int threads = 0;        // 0 = codec default
    int quantizer = 2;      // MPEG-4 qscale, 2 is near lossless
};

// Writes RGB frames into an audio-less MPEG-4 Part 2 stream. The container is
// taken from the output file extension.
class VideoEncoder : public QObject {
    Q_OBJECT
public:
    explicit VideoEncoder(QObject* parent = nullptr);
    ~VideoEncoder();

    bool open(const QString& filePath, const VideoEncoderSettings& settings);

    // Frames of a different size are scaled to the encoder size
    bool writeFrame(const QImage& frame);

    // Flushes the codec and writes the trailer; the file is complete after this
    bool finish();
    void close();

    bool isOpen() const { return m_isOpen; }
    int64_t framesWritten() const { return m_framesWritten; }
    QString errorString() const { return m_error; }

private:
    bool fail(const QString& message);
    bool drainPackets();

    bool m_isOpen = false;
    int64_t m_framesWritten = 0;
    VideoEncoderSettings m_settings;
    QString m_error;

    struct FFmpegEncodeContext;
    std::unique_ptr<FFmpegEncodeContext> m_ctx;
};
