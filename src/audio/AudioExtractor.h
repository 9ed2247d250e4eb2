#pragma once

#include <QString>
#include <QStringList>
#include "AudioBuffer.h"

class JobLogger;
class ProcessRunner;

// Pulls the audio track of a video through the external decoder into a mono
// WAV, then loads it. Every failure degrades to an absent buffer.
class AudioExtractor {
public:
    AudioExtractor(ProcessRunner& runner, JobLogger& logger,
                   const QString& ffmpegProgram, int threads = 0);

    AudioBuffer extract(const QString& videoPath, const QString& wavPath);

    static QStringList extractionArguments(const QString& videoPath, const QString& wavPath,
                                           int sampleRate, int threads);

private:
    ProcessRunner& m_runner;
    JobLogger& m_logger;
    QString m_program;
    int m_threads;
};
