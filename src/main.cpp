#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QGuiApplication>
#include <QTimer>
#include "AppConstants.h"
#include "ExportPipeline.h"
#include "JobConfig.h"
#include "JobLogger.h"
#include "JobRegistry.h"
#include "ProcessRunner.h"

namespace {

bool readInt(const QCommandLineParser& parser, const QCommandLineOption& option,
             int& field, QString* error) {
    if (!parser.isSet(option)) return true;
    bool ok = false;
    int value = parser.value(option).toInt(&ok);
    if (!ok) {
        *error = QString("--%1 expects an integer, got \"%2\"")
                     .arg(option.names().first(), parser.value(option));
        return false;
    }
    field = value;
    return true;
}

void readString(const QCommandLineParser& parser, const QCommandLineOption& option, QString& field) {
    if (parser.isSet(option)) field = parser.value(option);
}

} // namespace

int main(int argc, char* argv[]) {
    // Name plates need fonts but no display
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
        qputenv("QT_QPA_PLATFORM", "offscreen");

    QGuiApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    QCommandLineParser parser;
    parser.setApplicationDescription("Composes two speaker videos over a background image.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOpt("config", "Job file to start from.", "file");
    QCommandLineOption backgroundOpt("background", "Background image.", "file");
    QCommandLineOption speaker1Opt("speaker1", "First speaker video.", "file");
    QCommandLineOption speaker2Opt("speaker2", "Second speaker video.", "file");
    QCommandLineOption name1Opt("name1", "First speaker name.", "name");
    QCommandLineOption name2Opt("name2", "Second speaker name.", "name");
    QCommandLineOption outputOpt("output", "Output video file.", "file");
    QCommandLineOption previewOpt("preview", "Write a single preview frame as JPEG instead.", "file");
    QCommandLineOption speakerWidthOpt("speaker-width", "Speaker box width.", "px");
    QCommandLineOption speakerHeightOpt("speaker-height", "Speaker box height.", "px");
    QCommandLineOption fontSizeOpt("font-size", "Name plate font size.", "px");
    QCommandLineOption outputWidthOpt("output-width", "Output width.", "px");
    QCommandLineOption outputHeightOpt("output-height", "Output height.", "px");
    QCommandLineOption fpsOpt("fps", "Maximum output frame rate.", "fps");
    QCommandLineOption presetOpt("ffmpeg-preset", "Software encoder preset.", "preset");
    QCommandLineOption crfOpt("ffmpeg-crf", "Quality factor (0-51).", "crf");
    QCommandLineOption threadsOpt("ffmpeg-threads", "Encoder threads, 0 for all cores.", "n");
    QCommandLineOption noGpuOpt("no-gpu", "Disable hardware encoders.");
    QCommandLineOption ffmpegOpt("ffmpeg", "Path of the ffmpeg executable.", "program");

    parser.addOptions({ configOpt, backgroundOpt, speaker1Opt, speaker2Opt, name1Opt, name2Opt,
                        outputOpt, previewOpt, speakerWidthOpt, speakerHeightOpt, fontSizeOpt,
                        outputWidthOpt, outputHeightOpt, fpsOpt, presetOpt, crfOpt, threadsOpt,
                        noGpuOpt, ffmpegOpt });
    parser.process(app);

    CategoryLogger logger;
    JobDocument doc;

    if (parser.isSet(configOpt)) {
        JobConfig config;
        if (!config.load(parser.value(configOpt), doc)) {
            logger.error(config.errorString());
            return 1;
        }
    }

    readString(parser, backgroundOpt, doc.inputs.backgroundPath);
    readString(parser, speaker1Opt, doc.inputs.speaker1Path);
    readString(parser, speaker2Opt, doc.inputs.speaker2Path);
    readString(parser, name1Opt, doc.inputs.speaker1Name);
    readString(parser, name2Opt, doc.inputs.speaker2Name);
    readString(parser, outputOpt, doc.inputs.outputPath);
    readString(parser, presetOpt, doc.target.video.preset);
    readString(parser, ffmpegOpt, doc.ffmpegProgram);
    if (parser.isSet(noGpuOpt)) doc.target.acceleration.enabled = false;

    QString error;
    if (!readInt(parser, speakerWidthOpt, doc.layout.width, &error) ||
        !readInt(parser, speakerHeightOpt, doc.layout.height, &error) ||
        !readInt(parser, fontSizeOpt, doc.layout.fontSize, &error) ||
        !readInt(parser, outputWidthOpt, doc.target.width, &error) ||
        !readInt(parser, outputHeightOpt, doc.target.height, &error) ||
        !readInt(parser, fpsOpt, doc.target.fps, &error) ||
        !readInt(parser, crfOpt, doc.target.video.crf, &error) ||
        !readInt(parser, threadsOpt, doc.target.threads, &error)) {
        logger.error(error);
        return 1;
    }

    if (parser.isSet(previewOpt)) {
        doc.inputs = doc.inputs.trimmed();
        if (!doc.inputs.validate(&error) || !doc.target.validate(&error) ||
            !doc.layout.validate(doc.target.size(), &error)) {
            logger.error(error);
            return 1;
        }

        QtProcessRunner runner;
        ExportPipeline pipeline(doc.layout, doc.target, ResolvedCodecPlan(), runner, logger,
                                doc.ffmpegProgram);
        return pipeline.renderPreview(doc.inputs, parser.value(previewOpt)) ? 0 : 1;
    }

    JobRegistry registry;
    QString jobId;
    int lastProgress = -1;

    QObject::connect(&registry, &JobRegistry::jobFinished, &app,
                     [&](const QString& id, bool) {
        ExportJob result;
        if (id != jobId || !registry.takeResult(id, result)) return;
        if (result.status == JobStatus::Done) {
            logger.info(QString("Done: %1").arg(result.outputPath));
            app.exit(0);
        } else {
            logger.error(QString("Export failed: %1").arg(result.message));
            app.exit(1);
        }
    });

    jobId = registry.submit(doc, &error);
    if (jobId.isEmpty()) {
        logger.error(error);
        return 1;
    }

    QTimer poll;
    QObject::connect(&poll, &QTimer::timeout, &app, [&]() {
        ExportJob snapshot;
        if (!registry.job(jobId, snapshot) || snapshot.progress == lastProgress) return;
        lastProgress = snapshot.progress;
        logger.info(QString("Progress %1%").arg(snapshot.progress));
    });
    poll.start(500);

    return app.exec();
}
