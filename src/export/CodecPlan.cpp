#include "CodecPlan.h"
#include "AppConstants.h"
#include "JobLogger.h"
#include "ProcessRunner.h"
#include <QRegularExpression>

std::vector<EncodeAttempt> ResolvedCodecPlan::attempts() const {
    std::vector<EncodeAttempt> list;
    if (usesHardware())
        list.push_back({ preferred, CodecPlanner::codecName(preferred) });
    list.push_back({ VideoEncoderKind::Software, softwareCodec });
    return list;
}

namespace CodecPlanner {

QString codecName(VideoEncoderKind kind) {
    switch (kind) {
    case VideoEncoderKind::Nvenc: return "h264_nvenc";
    case VideoEncoderKind::Qsv:   return "h264_qsv";
    case VideoEncoderKind::Vaapi: return "h264_vaapi";
    case VideoEncoderKind::Software: break;
    }
    return AppConstants::SoftwareVideoCodec;
}

VideoEncoderKind detectHardwareEncoder(const QString& encoderListing) {
    for (VideoEncoderKind kind : { VideoEncoderKind::Nvenc, VideoEncoderKind::Qsv,
                                   VideoEncoderKind::Vaapi }) {
        QRegularExpression word(QString("\\b%1\\b").arg(codecName(kind)));
        if (word.match(encoderListing).hasMatch())
            return kind;
    }
    return VideoEncoderKind::Software;
}

ResolvedCodecPlan resolve(const ExportTarget& target, const EncoderListProbe& probe,
                          JobLogger& logger) {
    ResolvedCodecPlan plan;

    // Hardware codec names in the request select acceleration, not the fallback
    plan.softwareCodec = target.video.codec.startsWith("libx")
        ? target.video.codec : QString(AppConstants::SoftwareVideoCodec);

    if (!target.acceleration.enabled) {
        logger.info(QString("Hardware acceleration disabled, using %1").arg(plan.softwareCodec));
        return plan;
    }

    QString listing;
    if (!probe || !probe(listing)) {
        logger.warning(QString("Cannot query available encoders, using %1").arg(plan.softwareCodec));
        return plan;
    }

    plan.preferred = detectHardwareEncoder(listing);
    if (plan.usesHardware())
        logger.info(QString("Hardware encoder %1 available").arg(codecName(plan.preferred)));
    else
        logger.info(QString("No hardware encoder found, using %1").arg(plan.softwareCodec));
    return plan;
}

QStringList videoCodecArgs(const EncodeAttempt& attempt, const VideoCodecParams& params) {
    const QString quality = QString::number(params.crf);
    const QString bitrate = QString("%1k").arg(params.bitrateKbps);

    switch (attempt.kind) {
    case VideoEncoderKind::Nvenc:
        return { "-c:v", "h264_nvenc", "-preset", "fast", "-rc", "vbr",
                 "-cq", quality, "-b:v", bitrate,
                 "-maxrate", bitrate, "-bufsize", QString("%1k").arg(params.bitrateKbps * 2) };
    case VideoEncoderKind::Qsv:
        return { "-c:v", "h264_qsv", "-preset", "fast",
                 "-global_quality", quality, "-b:v", bitrate };
    case VideoEncoderKind::Vaapi:
        return { "-c:v", "h264_vaapi", "-qp", quality, "-b:v", bitrate };
    case VideoEncoderKind::Software:
        break;
    }
    return { "-c:v", attempt.codec, "-preset", params.preset,
             "-crf", quality, "-b:v", bitrate };
}

QStringList muxArgs(const QString& videoPath, const QString& wavPath,
                    const EncodeAttempt& attempt, const ExportTarget& target,
                    const QString& outputPath) {
    QStringList args{ "-i", videoPath };
    if (!wavPath.isEmpty())
        args << "-i" << wavPath;

    args << videoCodecArgs(attempt, target.video);

    if (!wavPath.isEmpty()) {
        args << "-c:a" << AppConstants::MuxAudioCodec
             << "-b:a" << AppConstants::MuxAudioBitrate
             << "-shortest";
    }

    args << "-movflags" << "+faststart" << "-y" << outputPath;
    return args;
}

EncoderListProbe processEncoderProbe(ProcessRunner& runner, const QString& program) {
    return [&runner, program](QString& listing) {
        ProcessResult result = runner.run(program, { "-hide_banner", "-encoders" });
        if (!result.succeeded()) return false;
        listing = QString::fromUtf8(result.standardOutput);
        return true;
    };
}

} // namespace CodecPlanner
