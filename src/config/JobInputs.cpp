#include "JobInputs.h"
#include <QFileInfo>
#include <QStringList>

namespace {

bool fail(QString* error, const QString& message) {
    if (error) *error = message;
    return false;
}

bool hasSuffix(const QString& path, const QStringList& suffixes) {
    return suffixes.contains(QFileInfo(path).suffix().toLower());
}

bool checkInputFile(const QString& path, const QString& role, QString* error) {
    if (path.trimmed().isEmpty())
        return fail(error, QString("%1 path is empty").arg(role));
    QFileInfo fi(path);
    if (!fi.exists() || !fi.isFile())
        return fail(error, QString("%1 not found: %2").arg(role, path));
    return true;
}

} // namespace

bool JobInputs::validateSpeakerName(const QString& name, QString* error) {
    const QString value = name.trimmed();
    if (value.isEmpty())
        return fail(error, "Speaker name must not be empty");
    if (value.size() > MaxNameLength)
        return fail(error, QString("Speaker name is longer than %1 characters").arg(MaxNameLength));

    static const QString forbidden = QStringLiteral("<>:\"|?*");
    for (QChar ch : value) {
        if (ch.category() == QChar::Other_Control)
            return fail(error, "Speaker name must not contain control characters");
        if (forbidden.contains(ch))
            return fail(error, QString("Speaker name must not contain '%1'").arg(ch));
    }
    return true;
}

bool JobInputs::isSupportedImage(const QString& path) {
    static const QStringList suffixes = { "jpg", "jpeg", "png", "bmp", "tiff" };
    return hasSuffix(path, suffixes);
}

bool JobInputs::isSupportedVideo(const QString& path) {
    static const QStringList suffixes = { "mp4", "avi", "mov", "mkv", "wmv" };
    return hasSuffix(path, suffixes);
}

bool JobInputs::validate(QString* error) const {
    if (!checkInputFile(backgroundPath, "Background image", error)) return false;
    if (!isSupportedImage(backgroundPath))
        return fail(error, QString("Unsupported background format: %1").arg(backgroundPath));

    if (!checkInputFile(speaker1Path, "Speaker 1 video", error)) return false;
    if (!checkInputFile(speaker2Path, "Speaker 2 video", error)) return false;
    if (!isSupportedVideo(speaker1Path))
        return fail(error, QString("Unsupported video format: %1").arg(speaker1Path));
    if (!isSupportedVideo(speaker2Path))
        return fail(error, QString("Unsupported video format: %1").arg(speaker2Path));

    if (!validateSpeakerName(speaker1Name, error)) return false;
    if (!validateSpeakerName(speaker2Name, error)) return false;

    if (outputPath.trimmed().isEmpty())
        return fail(error, "Output path is empty");
    return true;
}

JobInputs JobInputs::trimmed() const {
    JobInputs copy = *this;
    copy.backgroundPath = backgroundPath.trimmed();
    copy.speaker1Path = speaker1Path.trimmed();
    copy.speaker2Path = speaker2Path.trimmed();
    copy.speaker1Name = speaker1Name.trimmed();
    copy.speaker2Name = speaker2Name.trimmed();
    copy.outputPath = outputPath.trimmed();
    return copy;
}
