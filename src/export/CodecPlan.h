#pragma once

#include <QString>
#include <QStringList>
#include <functional>
#include <vector>
#include "ExportTarget.h"

class JobLogger;
class ProcessRunner;

enum class VideoEncoderKind {
    Software,
    Nvenc,
    Qsv,
    Vaapi
};

// One invocation of the external encoder for the final mux
struct EncodeAttempt {
    VideoEncoderKind kind = VideoEncoderKind::Software;
    QString codec;
};

// Encoders actually used for one job, decided once before the frame loop.
struct ResolvedCodecPlan {
    VideoEncoderKind preferred = VideoEncoderKind::Software;
    QString softwareCodec = "libx264";

    bool usesHardware() const { return preferred != VideoEncoderKind::Software; }

    // Hardware first when one was resolved, software always last
    std::vector<EncodeAttempt> attempts() const;
};

namespace CodecPlanner {
    // Fills the encoder listing of the external tool; false when it cannot be queried
    using EncoderListProbe = std::function<bool(QString& listing)>;

    QString codecName(VideoEncoderKind kind);

    // First of NVENC, QSV, VA-API present in the listing, Software otherwise
    VideoEncoderKind detectHardwareEncoder(const QString& encoderListing);

    ResolvedCodecPlan resolve(const ExportTarget& target, const EncoderListProbe& probe,
                              JobLogger& logger);

    QStringList videoCodecArgs(const EncodeAttempt& attempt, const VideoCodecParams& params);

    // Empty wavPath muxes the video alone
    QStringList muxArgs(const QString& videoPath, const QString& wavPath,
                        const EncodeAttempt& attempt, const ExportTarget& target,
                        const QString& outputPath);

    // Probe that runs "<program> -encoders" through the runner
    EncoderListProbe processEncoderProbe(ProcessRunner& runner, const QString& program);
}
