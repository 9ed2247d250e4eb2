#pragma once

#include <QImage>
#include <QObject>
#include <QString>
#include "CodecPlan.h"
#include "ExportTarget.h"
#include "JobInputs.h"
#include "SourceFrame.h"
#include "SpeakerLayout.h"
#include "TimelinePlan.h"

class JobLogger;
class ProcessRunner;
class VideoDecoder;

// Per-job counters, mostly useful to check what ended up in the output
struct ExportStats {
    int64_t framesWritten = 0;
    int64_t speaker1Frames = 0;
    int64_t speaker2Frames = 0;
    int64_t readErrors = 0;
    bool hasAudio = false;
    QString encoderUsed;        // empty when the intermediate was published
};

// Runs one composition job end to end: probe, audio, frame loop into an
// intermediate file, final encode with fallback, publish.
class ExportPipeline : public QObject {
    Q_OBJECT
public:
    ExportPipeline(const SpeakerLayout& layout, const ExportTarget& target,
                   const ResolvedCodecPlan& codecPlan, ProcessRunner& runner,
                   JobLogger& logger, const QString& ffmpegProgram,
                   QObject* parent = nullptr);
    ~ExportPipeline();

    bool run(const JobInputs& inputs);

    // Writes the first frame that shows any speaker as a JPEG
    bool renderPreview(const JobInputs& inputs, const QString& jpegPath);

    int progressValue() const { return m_progress; }
    const TimelinePlan& timeline() const { return m_timeline; }
    const ExportStats& stats() const { return m_stats; }
    const SpeakerLayout& layout() const { return m_layout; }
    QString errorString() const { return m_error; }

signals:
    void progress(int percent);
    void finished(bool success, const QString& message);

private:
    bool openSources(const JobInputs& inputs, QImage& background,
                     VideoDecoder& speaker1, VideoDecoder& speaker2);
    SourceFrame nextFrame(VideoDecoder& decoder, int speaker);
    bool encodeFrames(const JobInputs& inputs, const QImage& background,
                      VideoDecoder& speaker1, VideoDecoder& speaker2,
                      const QString& intermediatePath);
    QString encodeFinal(const QString& intermediatePath, const QString& wavPath,
                        const QString& scratchDir, const QString& outputPath);
    bool publish(const QString& sourcePath, const QString& outputPath);

    void reportProgress(int percent);
    bool fail(const QString& message);

    SpeakerLayout m_layout;
    ExportTarget m_target;
    ResolvedCodecPlan m_codecPlan;
    ProcessRunner& m_runner;
    JobLogger& m_logger;
    QString m_program;

    TimelinePlan m_timeline;
    ExportStats m_stats;
    int m_progress = 0;
    QString m_error;
};
