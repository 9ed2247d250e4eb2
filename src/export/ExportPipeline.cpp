#include "ExportPipeline.h"
#include "AppConstants.h"
#include "AudioExtractor.h"
#include "AudioMixer.h"
#include "FrameCompositor.h"
#include "ImageCompositor.h"
#include "JobLogger.h"
#include "ProcessRunner.h"
#include "TimeUtil.h"
#include "VideoDecoder.h"
#include "VideoEncoder.h"
#include "WavWriter.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

ExportPipeline::ExportPipeline(const SpeakerLayout& layout, const ExportTarget& target,
                               const ResolvedCodecPlan& codecPlan, ProcessRunner& runner,
                               JobLogger& logger, const QString& ffmpegProgram,
                               QObject* parent)
    : QObject(parent)
    , m_layout(layout.clampedTo(target.size()))
    , m_target(target)
    , m_codecPlan(codecPlan)
    , m_runner(runner)
    , m_logger(logger)
    , m_program(ffmpegProgram)
{}

ExportPipeline::~ExportPipeline() = default;

void ExportPipeline::reportProgress(int percent) {
    if (percent <= m_progress) return;
    m_progress = percent;
    emit progress(m_progress);
}

bool ExportPipeline::fail(const QString& message) {
    m_error = message;
    m_logger.error(message);
    emit finished(false, message);
    return false;
}

bool ExportPipeline::openSources(const JobInputs& inputs, QImage& background,
                                 VideoDecoder& speaker1, VideoDecoder& speaker2) {
    QString error;
    background = ImageCompositor::loadImage(inputs.backgroundPath, &error);
    if (background.isNull()) {
        m_error = error;
        return false;
    }

    if (!speaker1.open(inputs.speaker1Path)) {
        m_error = speaker1.errorString();
        return false;
    }
    if (!speaker2.open(inputs.speaker2Path)) {
        m_error = speaker2.errorString();
        return false;
    }

    m_timeline = TimelinePlan::fromStreams(speaker1.info(), speaker2.info(), m_target.fps);
    if (m_timeline.isEmpty()) {
        m_error = QString("Speaker videos contain no frames to compose (%1 and %2)")
                      .arg(QFileInfo(inputs.speaker1Path).fileName(),
                           QFileInfo(inputs.speaker2Path).fileName());
        return false;
    }

    m_logger.info(QString("Speaker 1: %1x%2 @ %3 fps, %4 frames")
                      .arg(speaker1.info().width).arg(speaker1.info().height)
                      .arg(speaker1.info().fps, 0, 'f', 2).arg(speaker1.info().totalFrames));
    m_logger.info(QString("Speaker 2: %1x%2 @ %3 fps, %4 frames")
                      .arg(speaker2.info().width).arg(speaker2.info().height)
                      .arg(speaker2.info().fps, 0, 'f', 2).arg(speaker2.info().totalFrames));
    m_logger.info(QString("Output: %1x%2 @ %3 fps, %4 frames (%5)")
                      .arg(m_target.width).arg(m_target.height)
                      .arg(m_timeline.fps, 0, 'f', 2).arg(m_timeline.frameCount)
                      .arg(TimeUtil::secondsToHMS(m_timeline.duration())));
    return true;
}

SourceFrame ExportPipeline::nextFrame(VideoDecoder& decoder, int speaker) {
    SourceFrame frame = decoder.readFrame();
    switch (frame.state) {
    case SourceFrame::State::Frame:
        if (speaker == 1) ++m_stats.speaker1Frames;
        else ++m_stats.speaker2Frames;
        break;
    case SourceFrame::State::ReadError:
        if (m_stats.readErrors++ == 0)
            m_logger.warning(QString("Speaker %1 frame unreadable at %2, skipped: %3")
                                 .arg(speaker)
                                 .arg(TimeUtil::secondsToHMS(decoder.currentTime()))
                                 .arg(decoder.errorString()));
        break;
    case SourceFrame::State::Exhausted:
        break;
    }
    return frame;
}

bool ExportPipeline::encodeFrames(const JobInputs& inputs, const QImage& background,
                                  VideoDecoder& speaker1, VideoDecoder& speaker2,
                                  const QString& intermediatePath) {
    FrameCompositor compositor(m_layout, m_target.size(), m_logger);
    compositor.setBackground(background);

    VideoEncoderSettings settings;
    settings.width = m_target.width;
    settings.height = m_target.height;
    settings.fps = m_timeline.fps;
    settings.threads = m_target.threads;

    VideoEncoder encoder;
    if (!encoder.open(intermediatePath, settings)) {
        m_error = encoder.errorString();
        return false;
    }

    const int64_t total = m_timeline.frameCount;
    const int span = AppConstants::ProgressFramesDone - AppConstants::ProgressAudioReady;

    for (int64_t index = 0; index < total; ++index) {
        SourceFrame frame1 = nextFrame(speaker1, 1);
        SourceFrame frame2 = nextFrame(speaker2, 2);

        QImage composed = compositor.compose(frame1, frame2, inputs.speaker1Name, inputs.speaker2Name);
        if (!encoder.writeFrame(composed)) {
            m_error = QString("Cannot write frame %1: %2").arg(index).arg(encoder.errorString());
            return false;
        }
        ++m_stats.framesWritten;

        reportProgress(AppConstants::ProgressAudioReady + static_cast<int>(span * index / total));
    }

    if (!encoder.finish()) {
        m_error = encoder.errorString();
        return false;
    }

    if (m_stats.readErrors > 0)
        m_logger.warning(QString("%1 unreadable frames were left out").arg(m_stats.readErrors));
    m_logger.info(QString("Composed %1 frames").arg(m_stats.framesWritten));
    return true;
}

QString ExportPipeline::encodeFinal(const QString& intermediatePath, const QString& wavPath,
                                    const QString& scratchDir, const QString& outputPath) {
    QString suffix = QFileInfo(outputPath).suffix();
    if (suffix.isEmpty()) suffix = "mp4";
    const QString encodedPath = QDir(scratchDir).filePath(QString("encoded.%1").arg(suffix));

    for (const EncodeAttempt& attempt : m_codecPlan.attempts()) {
        QFile::remove(encodedPath);
        m_logger.info(QString("Encoding with %1").arg(attempt.codec));

        ProcessResult result = m_runner.run(m_program,
            CodecPlanner::muxArgs(intermediatePath, wavPath, attempt, m_target, encodedPath));

        if (result.succeeded() && QFileInfo(encodedPath).size() > 0) {
            m_stats.encoderUsed = attempt.codec;
            return encodedPath;
        }

        if (!result.started)
            m_logger.warning(QString("%1 could not be started for %2").arg(m_program, attempt.codec));
        else
            m_logger.warning(QString("Encoding with %1 failed (exit %2): %3")
                                 .arg(attempt.codec).arg(result.exitCode)
                                 .arg(result.diagnosticTail()));
    }

    m_logger.warning("All encoders failed, publishing the intermediate video without audio");
    m_stats.hasAudio = false;
    return intermediatePath;
}

bool ExportPipeline::publish(const QString& sourcePath, const QString& outputPath) {
    QFileInfo target(outputPath);
    if (!QDir().mkpath(target.absolutePath())) {
        m_error = QString("Cannot create output directory %1").arg(target.absolutePath());
        return false;
    }

    if (target.exists() && !QFile::remove(outputPath)) {
        m_error = QString("Cannot replace existing output %1").arg(outputPath);
        return false;
    }

    // Rename fails across file systems, copy is the fallback
    if (QFile::rename(sourcePath, outputPath)) return true;
    if (QFile::copy(sourcePath, outputPath)) return true;

    QFile::remove(outputPath);
    m_error = QString("Cannot write output %1").arg(outputPath);
    return false;
}

bool ExportPipeline::run(const JobInputs& inputs) {
    m_error.clear();
    m_stats = ExportStats{};
    m_timeline = TimelinePlan{};
    reportProgress(AppConstants::ProgressAccepted);

    QTemporaryDir scratch;
    if (!scratch.isValid())
        return fail(QString("Cannot create scratch directory: %1").arg(scratch.errorString()));

    // Probe
    QImage background;
    VideoDecoder speaker1;
    VideoDecoder speaker2;
    if (!openSources(inputs, background, speaker1, speaker2))
        return fail(m_error);

    // Audio
    AudioExtractor extractor(m_runner, m_logger, m_program, m_target.threads);
    AudioBuffer audio1 = extractor.extract(inputs.speaker1Path, scratch.filePath("speaker1.wav"));
    AudioBuffer audio2 = extractor.extract(inputs.speaker2Path, scratch.filePath("speaker2.wav"));
    AudioBuffer mixed = AudioMixer::mix(audio1, audio2, m_timeline.duration());

    QString wavPath;
    if (mixed.present) {
        QString error;
        wavPath = scratch.filePath("mixed.wav");
        if (!WavWriter::writeMono16(wavPath, mixed.samples, mixed.sampleRate, &error)) {
            m_logger.warning(QString("Dropping audio: %1").arg(error));
            wavPath.clear();
        }
    } else {
        m_logger.info("Neither speaker has audio, the output will be silent");
    }
    m_stats.hasAudio = !wavPath.isEmpty();
    reportProgress(AppConstants::ProgressAudioReady);

    // Frames
    const QString intermediatePath = scratch.filePath("intermediate.mp4");
    if (!encodeFrames(inputs, background, speaker1, speaker2, intermediatePath))
        return fail(m_error);
    speaker1.close();
    speaker2.close();
    reportProgress(AppConstants::ProgressFramesDone);

    // Mux
    reportProgress(AppConstants::ProgressMuxing);
    const QString finalPath = encodeFinal(intermediatePath, wavPath, scratch.path(), inputs.outputPath);

    if (!publish(finalPath, inputs.outputPath))
        return fail(m_error);

    reportProgress(AppConstants::ProgressComplete);
    m_logger.info(QString("Wrote %1").arg(inputs.outputPath));
    emit finished(true, inputs.outputPath);
    return true;
}

bool ExportPipeline::renderPreview(const JobInputs& inputs, const QString& jpegPath) {
    m_error.clear();
    m_stats = ExportStats{};

    QImage background;
    VideoDecoder speaker1;
    VideoDecoder speaker2;
    if (!openSources(inputs, background, speaker1, speaker2))
        return fail(m_error);

    FrameCompositor compositor(m_layout, m_target.size(), m_logger);
    compositor.setBackground(background);

    QImage preview;
    for (int64_t index = 0; index < m_timeline.frameCount; ++index) {
        SourceFrame frame1 = nextFrame(speaker1, 1);
        SourceFrame frame2 = nextFrame(speaker2, 2);
        if (!frame1.hasImage() && !frame2.hasImage()) continue;
        preview = compositor.compose(frame1, frame2, inputs.speaker1Name, inputs.speaker2Name);
        break;
    }
    if (preview.isNull())
        return fail("No speaker frame could be decoded for the preview");

    QFileInfo target(jpegPath);
    if (!QDir().mkpath(target.absolutePath()))
        return fail(QString("Cannot create preview directory %1").arg(target.absolutePath()));
    if (!preview.save(jpegPath, "JPG", 90))
        return fail(QString("Cannot write preview %1").arg(jpegPath));

    m_logger.info(QString("Wrote preview %1").arg(jpegPath));
    emit finished(true, jpegPath);
    return true;
}
