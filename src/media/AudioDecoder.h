#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include <vector>

struct AudioInfo {
    int sampleRate = 0;       // source rate
    int channels = 0;         // source channel count
    double duration = 0.0;
    QString codecName;
};

// Decodes the first audio stream of a file into mono float samples at a fixed
// output rate, downmixing and resampling as needed.
class AudioDecoder : public QObject {
    Q_OBJECT
public:
    explicit AudioDecoder(QObject* parent = nullptr);
    ~AudioDecoder();

    bool open(const QString& filePath, int outputSampleRate);
    void close();
    bool isOpen() const { return m_isOpen; }

    // Decodes to the end of the stream, appending samples in [-1, 1]
    bool decodeAll(std::vector<float>& samples);

    const AudioInfo& info() const { return m_info; }
    int outputSampleRate() const { return m_outputRate; }
    QString errorString() const { return m_error; }

private:
    bool fail(const QString& message);
    bool convertFrame(std::vector<float>& samples);
    bool drainResampler(std::vector<float>& samples);

    bool m_isOpen = false;
    int m_outputRate = 0;
    AudioInfo m_info;
    QString m_error;

    struct FFmpegAudioContext;
    std::unique_ptr<FFmpegAudioContext> m_ctx;
};
