#include "JobConfig.h"
#include <QFile>
#include <QJsonDocument>

namespace {

QColor colorFromJson(const QJsonValue& value, const QColor& fallback) {
    if (!value.isString()) return fallback;
    QColor color(value.toString());
    return color.isValid() ? color : fallback;
}

} // namespace

JobConfig::JobConfig(QObject* parent) : QObject(parent) {}
JobConfig::~JobConfig() = default;

bool JobConfig::save(const QString& filePath, const JobDocument& doc) {
    QJsonObject root;
    root["version"] = FormatVersion;
    root["inputs"] = inputsToJson(doc.inputs);
    root["speaker"] = layoutToJson(doc.layout);
    root["export"] = targetToJson(doc.target);
    root["ffmpegPath"] = doc.ffmpegProgram;

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }

    if (file.write(QJsonDocument(root).toJson(QJsonDocument::Indented)) < 0) {
        m_error = QString("Write failed: %1").arg(file.errorString());
        return false;
    }
    return true;
}

bool JobConfig::load(const QString& filePath, JobDocument& doc) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        return false;
    }

    QJsonParseError parseError;
    auto json = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!json.isObject()) {
        m_error = QString("Invalid job file format: %1").arg(parseError.errorString());
        return false;
    }

    auto root = json.object();
    if (root["version"].toInt(0) < 1) {
        m_error = "Unsupported job file version";
        return false;
    }

    doc.inputs = inputsFromJson(root["inputs"].toObject());
    doc.layout = layoutFromJson(root["speaker"].toObject());
    doc.target = targetFromJson(root["export"].toObject());
    doc.ffmpegProgram = root["ffmpegPath"].toString(AppConstants::DefaultFfmpegProgram);
    return true;
}

QJsonObject JobConfig::inputsToJson(const JobInputs& inputs) {
    QJsonObject obj;
    obj["background"] = inputs.backgroundPath;
    obj["speaker1"] = inputs.speaker1Path;
    obj["speaker2"] = inputs.speaker2Path;
    obj["name1"] = inputs.speaker1Name;
    obj["name2"] = inputs.speaker2Name;
    obj["output"] = inputs.outputPath;
    return obj;
}

JobInputs JobConfig::inputsFromJson(const QJsonObject& obj) {
    JobInputs inputs;
    inputs.backgroundPath = obj["background"].toString();
    inputs.speaker1Path = obj["speaker1"].toString();
    inputs.speaker2Path = obj["speaker2"].toString();
    inputs.speaker1Name = obj["name1"].toString();
    inputs.speaker2Name = obj["name2"].toString();
    inputs.outputPath = obj["output"].toString(inputs.outputPath);
    return inputs;
}

QJsonObject JobConfig::layoutToJson(const SpeakerLayout& layout) {
    QJsonObject obj;
    obj["width"] = layout.width;
    obj["height"] = layout.height;
    if (layout.hasFixedPosition) {
        QJsonObject pos;
        pos["x"] = layout.fixedPosition.x();
        pos["y"] = layout.fixedPosition.y();
        obj["position"] = pos;
    }
    obj["fontSize"] = layout.fontSize;
    obj["fontFamily"] = layout.fontFamily;
    obj["fontPath"] = layout.fontPath;
    obj["fontColor"] = layout.fontColor.name(QColor::HexArgb);
    obj["plateBgColor"] = layout.plateBackground.name(QColor::HexArgb);
    obj["plateBorderColor"] = layout.plateBorderColor.name(QColor::HexArgb);
    obj["plateBorderWidth"] = layout.plateBorderWidth;
    obj["platePadding"] = layout.platePadding;
    return obj;
}

SpeakerLayout JobConfig::layoutFromJson(const QJsonObject& obj) {
    SpeakerLayout layout;
    layout.width = obj["width"].toInt(layout.width);
    layout.height = obj["height"].toInt(layout.height);
    if (obj["position"].isObject()) {
        auto pos = obj["position"].toObject();
        layout.hasFixedPosition = true;
        layout.fixedPosition = QPoint(pos["x"].toInt(), pos["y"].toInt());
    }
    layout.fontSize = obj["fontSize"].toInt(layout.fontSize);
    layout.fontFamily = obj["fontFamily"].toString();
    layout.fontPath = obj["fontPath"].toString();
    layout.fontColor = colorFromJson(obj["fontColor"], layout.fontColor);
    layout.plateBackground = colorFromJson(obj["plateBgColor"], layout.plateBackground);
    layout.plateBorderColor = colorFromJson(obj["plateBorderColor"], layout.plateBorderColor);
    layout.plateBorderWidth = obj["plateBorderWidth"].toInt(layout.plateBorderWidth);
    layout.platePadding = obj["platePadding"].toInt(layout.platePadding);
    return layout;
}

QJsonObject JobConfig::targetToJson(const ExportTarget& target) {
    QJsonObject video;
    video["codec"] = target.video.codec;
    video["preset"] = target.video.preset;
    video["crf"] = target.video.crf;
    video["bitrateKbps"] = target.video.bitrateKbps;

    QJsonObject audio;
    audio["codec"] = target.audio.codec;
    audio["bitrateKbps"] = target.audio.bitrateKbps;
    audio["sampleRate"] = target.audio.sampleRate;
    audio["channels"] = target.audio.channels;

    QJsonObject obj;
    obj["width"] = target.width;
    obj["height"] = target.height;
    obj["fps"] = target.fps;
    obj["threads"] = target.threads;
    obj["useGpu"] = target.acceleration.enabled;
    obj["video"] = video;
    obj["audio"] = audio;
    return obj;
}

ExportTarget JobConfig::targetFromJson(const QJsonObject& obj) {
    ExportTarget target;
    target.width = obj["width"].toInt(target.width);
    target.height = obj["height"].toInt(target.height);
    target.fps = obj["fps"].toInt(target.fps);
    target.threads = obj["threads"].toInt(target.threads);
    target.acceleration.enabled = obj["useGpu"].toBool(target.acceleration.enabled);

    auto video = obj["video"].toObject();
    target.video.codec = video["codec"].toString(target.video.codec);
    target.video.preset = video["preset"].toString(target.video.preset);
    target.video.crf = video["crf"].toInt(target.video.crf);
    target.video.bitrateKbps = video["bitrateKbps"].toInt(target.video.bitrateKbps);

    auto audio = obj["audio"].toObject();
    target.audio.codec = audio["codec"].toString(target.audio.codec);
    target.audio.bitrateKbps = audio["bitrateKbps"].toInt(target.audio.bitrateKbps);
    target.audio.sampleRate = audio["sampleRate"].toInt(target.audio.sampleRate);
    target.audio.channels = audio["channels"].toInt(target.audio.channels);
    return target;
}
