#pragma once

#include <QString>

struct JobInputs {
    QString backgroundPath;
    QString speaker1Path;
    QString speaker2Path;
    QString speaker1Name;
    QString speaker2Name;
    QString outputPath = "meeting_output.mp4";

    static constexpr int MaxNameLength = 100;

    // Checks extensions, existence of the input files and both names
    bool validate(QString* error = nullptr) const;

    // Copy with surrounding whitespace removed from names and paths
    JobInputs trimmed() const;

    static bool validateSpeakerName(const QString& name, QString* error = nullptr);
    static bool isSupportedImage(const QString& path);
    static bool isSupportedVideo(const QString& path);
};
