#include "AudioExtractor.h"
#include "AudioDecoder.h"
#include "AppConstants.h"
#include "JobLogger.h"
#include "MediaProbe.h"
#include "ProcessRunner.h"
#include <QFile>
#include <QFileInfo>

AudioExtractor::AudioExtractor(ProcessRunner& runner, JobLogger& logger,
                               const QString& ffmpegProgram, int threads)
    : m_runner(runner)
    , m_logger(logger)
    , m_program(ffmpegProgram)
    , m_threads(threads)
{}

QStringList AudioExtractor::extractionArguments(const QString& videoPath, const QString& wavPath,
                                                int sampleRate, int threads) {
    return {
        "-i", videoPath,
        "-vn",
        "-acodec", "pcm_s16le",
        "-ar", QString::number(sampleRate),
        "-ac", "1",
        "-threads", QString::number(threads),
        "-y", wavPath
    };
}

AudioBuffer AudioExtractor::extract(const QString& videoPath, const QString& wavPath) {
    const QString name = QFileInfo(videoPath).fileName();

    // Skip the process entirely when the container has no audio stream
    MediaProbe probe;
    if (probe.probe(videoPath)) {
        if (!probe.info().hasAudio()) {
            m_logger.info(QString("%1 has no audio track").arg(name));
            return AudioBuffer::absent();
        }
        m_logger.info(QString("%1 audio: %2").arg(name, probe.info().audioSummary()));
    }

    ProcessResult result = m_runner.run(m_program,
        extractionArguments(videoPath, wavPath, AppConstants::AudioSampleRate, m_threads));
    if (!result.succeeded()) {
        if (!result.started)
            m_logger.warning(QString("Audio extraction for %1 skipped, %2 could not be started")
                                 .arg(name, m_program));
        else
            m_logger.warning(QString("Audio extraction for %1 failed (exit %2): %3")
                                 .arg(name).arg(result.exitCode).arg(result.diagnosticTail()));
        QFile::remove(wavPath);
        return AudioBuffer::absent();
    }

    AudioDecoder decoder;
    std::vector<float> samples;
    bool ok = decoder.open(wavPath, AppConstants::AudioSampleRate) && decoder.decodeAll(samples);
    decoder.close();
    QFile::remove(wavPath);

    if (!ok) {
        m_logger.warning(QString("Cannot load extracted audio of %1: %2")
                             .arg(name, decoder.errorString()));
        return AudioBuffer::absent();
    }

    m_logger.info(QString("Extracted %1 s of audio from %2")
                      .arg(static_cast<double>(samples.size()) / AppConstants::AudioSampleRate, 0, 'f', 2)
                      .arg(name));
    return AudioBuffer::fromSamples(std::move(samples));
}
