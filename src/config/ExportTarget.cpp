#include "ExportTarget.h"

namespace {

bool fail(QString* error, const QString& message) {
    if (error) *error = message;
    return false;
}

} // namespace

const QStringList& VideoCodecParams::supportedCodecs() {
    static const QStringList codecs = {
        "libx264", "libx265", "h264_nvenc", "h264_qsv", "h264_vaapi"
    };
    return codecs;
}

const QStringList& VideoCodecParams::supportedPresets() {
    static const QStringList presets = {
        "ultrafast", "superfast", "veryfast", "faster", "fast",
        "medium", "slow", "slower", "veryslow"
    };
    return presets;
}

const QStringList& AudioCodecParams::supportedCodecs() {
    static const QStringList codecs = { "aac", "mp3", "ac3" };
    return codecs;
}

bool ExportTarget::validate(QString* error) const {
    if (width < 1 || width > MaxDimension || height < 1 || height > MaxDimension)
        return fail(error, QString("Output size %1x%2 is outside 1..%3")
                               .arg(width).arg(height).arg(MaxDimension));
    if (fps < 1 || fps > MaxFps)
        return fail(error, QString("Output fps %1 is outside 1..%2").arg(fps).arg(MaxFps));
    if (threads < 0 || threads > MaxThreads)
        return fail(error, QString("Thread count %1 is outside 0..%2").arg(threads).arg(MaxThreads));

    if (!VideoCodecParams::supportedCodecs().contains(video.codec))
        return fail(error, QString("Unsupported video codec: %1").arg(video.codec));
    if (!VideoCodecParams::supportedPresets().contains(video.preset))
        return fail(error, QString("Unsupported encoder preset: %1").arg(video.preset));
    if (video.crf < 0 || video.crf > MaxCrf)
        return fail(error, QString("Quality factor %1 is outside 0..%2").arg(video.crf).arg(MaxCrf));
    if (video.bitrateKbps <= 0)
        return fail(error, "Video bitrate must be positive");

    if (!AudioCodecParams::supportedCodecs().contains(audio.codec))
        return fail(error, QString("Unsupported audio codec: %1").arg(audio.codec));
    if (audio.bitrateKbps <= 0 || audio.sampleRate <= 0)
        return fail(error, "Audio bitrate and sample rate must be positive");
    if (audio.channels < 1 || audio.channels > MaxAudioChannels)
        return fail(error, QString("Audio channel count %1 is outside 1..%2")
                               .arg(audio.channels).arg(MaxAudioChannels));
    return true;
}
