#pragma once

#include <QObject>
#include <QString>
#include <QJsonObject>
#include "AppConstants.h"
#include "ExportTarget.h"
#include "JobInputs.h"
#include "SpeakerLayout.h"

// Everything needed to run one export, as stored in a job file.
struct JobDocument {
    JobInputs inputs;
    SpeakerLayout layout;
    ExportTarget target;
    QString ffmpegProgram = AppConstants::DefaultFfmpegProgram;
};

class JobConfig : public QObject {
    Q_OBJECT
public:
    explicit JobConfig(QObject* parent = nullptr);
    ~JobConfig();

    bool save(const QString& filePath, const JobDocument& doc);
    bool load(const QString& filePath, JobDocument& doc);

    static QJsonObject inputsToJson(const JobInputs& inputs);
    static JobInputs inputsFromJson(const QJsonObject& obj);

    static QJsonObject layoutToJson(const SpeakerLayout& layout);
    static SpeakerLayout layoutFromJson(const QJsonObject& obj);

    static QJsonObject targetToJson(const ExportTarget& target);
    static ExportTarget targetFromJson(const QJsonObject& obj);

    QString errorString() const { return m_error; }

    static constexpr int FormatVersion = 1;

private:
    QString m_error;
};
