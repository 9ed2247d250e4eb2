#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <cmath>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QGuiApplication>
#include <QTemporaryDir>
#include <vector>
#include "TestSupport.h"
#include "export/ExportPipeline.h"
#include "media/MediaProbe.h"
#include "media/VideoDecoder.h"

namespace {

const QColor BackgroundColor(0, 0, 200);
const QColor Speaker1Color(220, 0, 0);
const QColor Speaker2Color(0, 200, 0);

bool writeSpeaker(const QString& path, double seconds, double fps, const QColor& color, bool tone) {
    const int frames = static_cast<int>(std::lround(seconds * fps));
    if (tone) return writeSolidVideoWithTone(path, 64, 48, fps, frames, color, seconds);
    return writeSolidVideo(path, 64, 48, fps, frames, color);
}

int extractionCalls(const FakeProcessRunner& runner) {
    int count = 0;
    for (const QStringList& call : runner.calls)
        if (call.contains("-vn")) ++count;
    return count;
}

struct Fixture {
    QTemporaryDir dir;
    JobInputs inputs;
    SpeakerLayout layout;
    ExportTarget target;

    // speaker 1: seconds1 at fps1, speaker 2: seconds2 at fps2. A speaker
    // with a tone carries an audio track of the same length.
    Fixture(double seconds1, double fps1, double seconds2, double fps2,
            bool tone1 = false, bool tone2 = false) {
        assert(dir.isValid());
        inputs.backgroundPath = dir.filePath("background.png");
        inputs.speaker1Path = dir.filePath(tone1 ? "speaker1.mkv" : "speaker1.mp4");
        inputs.speaker2Path = dir.filePath(tone2 ? "speaker2.mkv" : "speaker2.mp4");
        inputs.speaker1Name = "Alice";
        inputs.speaker2Name = "Bob";
        inputs.outputPath = dir.filePath("out/meeting.mp4");

        assert(writeSolidImage(inputs.backgroundPath, 640, 480, BackgroundColor));
        assert(writeSpeaker(inputs.speaker1Path, seconds1, fps1, Speaker1Color, tone1));
        assert(writeSpeaker(inputs.speaker2Path, seconds2, fps2, Speaker2Color, tone2));

        layout.width = 120;
        layout.height = 90;
        target.width = 320;
        target.height = 240;
        target.fps = 30;
    }
};

ResolvedCodecPlan softwarePlan() {
    return ResolvedCodecPlan();
}

ResolvedCodecPlan nvencPlan() {
    ResolvedCodecPlan plan;
    plan.preferred = VideoEncoderKind::Nvenc;
    return plan;
}

} // namespace

void test_end_to_end_timeline() {
    Fixture fx(10.0, 30.0, 6.0, 24.0);
    FakeProcessRunner runner;
    RecordingLogger logger;

    ExportPipeline pipeline(fx.layout, fx.target, softwarePlan(), runner, logger, "ffmpeg");
    std::vector<int> progress;
    QObject::connect(&pipeline, &ExportPipeline::progress, [&progress](int p) { progress.push_back(p); });
    bool finishedOk = false;
    QObject::connect(&pipeline, &ExportPipeline::finished,
                     [&finishedOk](bool ok, const QString&) { finishedOk = ok; });

    bool ok = pipeline.run(fx.inputs);
    if (!ok) printf("FAIL: %s\n", pipeline.errorString().toUtf8().constData());
    assert(ok);
    assert(finishedOk);

    const TimelinePlan& plan = pipeline.timeline();
    assert(plan.fps == 24.0);
    assert(plan.frameCount == 300);
    assert(std::abs(plan.duration() - 12.5) < 1e-9);

    const ExportStats& stats = pipeline.stats();
    assert(stats.framesWritten == 300);
    assert(stats.speaker1Frames == 300);
    assert(stats.speaker2Frames == 144);
    assert(!stats.hasAudio);
    assert(stats.encoderUsed == "libx264");

    // Progress never goes back and ends at 100
    assert(!progress.empty());
    assert(progress.front() == 2);
    assert(progress.back() == 100);
    for (size_t i = 1; i < progress.size(); ++i)
        assert(progress[i] > progress[i - 1]);
    assert(pipeline.progressValue() == 100);

    // Silent sources: the mux call carries no audio input
    assert(runner.muxCodecs == QStringList({ "libx264" }));
    const QStringList& mux = runner.calls.back();
    assert(!mux.contains("-c:a"));
    assert(mux.count("-i") == 1);

    // The fake encoder copies the intermediate, so the output can be decoded
    VideoDecoder output;
    assert(output.open(fx.inputs.outputPath));
    assert(output.info().width == 320);
    assert(output.info().height == 240);
    assert(std::abs(output.info().fps - 24.0) < 0.01);
    assert(output.info().totalFrames == 300);

    const SpeakerLayout clamped = pipeline.layout();
    auto boxes = clamped.speakerBoxes(fx.target.size());
    int index = 0;
    while (true) {
        SourceFrame frame = output.readFrame();
        if (frame.state == SourceFrame::State::Exhausted) break;
        assert(frame.hasImage());
        const QRgb s1 = frame.image.pixel(boxes.first.center());
        const QRgb s2 = frame.image.pixel(boxes.second.center());
        assert(colorNear(s1, Speaker1Color));
        if (index < 144)
            assert(colorNear(s2, Speaker2Color));
        else
            assert(colorNear(s2, BackgroundColor));
        ++index;
    }
    assert(index == 300);

    // Scratch files are gone, only the output remains
    QDir outDir(QFileInfo(fx.inputs.outputPath).absolutePath());
    assert(outDir.entryList(QDir::Files) == QStringList({ "meeting.mp4" }));
    printf("PASS: test_end_to_end_timeline\n");
}

void test_hardware_failure_falls_back_to_software() {
    Fixture fx(1.0, 25.0, 1.0, 25.0);
    FakeProcessRunner runner;
    runner.failingCodecs << "h264_nvenc";
    RecordingLogger logger;

    ExportPipeline pipeline(fx.layout, fx.target, nvencPlan(), runner, logger, "ffmpeg");
    assert(pipeline.run(fx.inputs));
    assert(runner.muxCodecs == QStringList({ "h264_nvenc", "libx264" }));
    assert(pipeline.stats().encoderUsed == "libx264");
    assert(QFileInfo(fx.inputs.outputPath).size() > 0);

    bool warned = false;
    for (const QString& w : logger.warnings)
        warned = warned || w.contains("h264_nvenc");
    assert(warned);
    printf("PASS: test_hardware_failure_falls_back_to_software\n");
}

void test_all_encoders_fail_publishes_intermediate() {
    Fixture fx(1.0, 25.0, 0.5, 25.0);
    FakeProcessRunner runner;
    runner.failingCodecs << "h264_nvenc" << "libx264";
    RecordingLogger logger;

    ExportPipeline pipeline(fx.layout, fx.target, nvencPlan(), runner, logger, "ffmpeg");
    assert(pipeline.run(fx.inputs));
    assert(runner.muxCodecs == QStringList({ "h264_nvenc", "libx264" }));
    assert(pipeline.stats().encoderUsed.isEmpty());
    assert(pipeline.progressValue() == 100);

    QFile output(fx.inputs.outputPath);
    assert(output.open(QIODevice::ReadOnly));
    const QByteArray published = output.readAll();
    assert(!published.isEmpty());
    assert(published == runner.lastMuxInput);
    printf("PASS: test_all_encoders_fail_publishes_intermediate\n");
}

void test_silent_sources_skip_extraction() {
    Fixture fx(1.0, 25.0, 1.0, 25.0);
    FakeProcessRunner runner;
    runner.audioAvailable = true;
    RecordingLogger logger;

    ExportPipeline pipeline(fx.layout, fx.target, softwarePlan(), runner, logger, "ffmpeg");
    assert(pipeline.run(fx.inputs));
    assert(!pipeline.stats().hasAudio);

    bool extractionRan = false;
    for (const QStringList& call : runner.calls)
        extractionRan = extractionRan || call.contains("-vn");
    assert(!extractionRan);
    assert(runner.calls.size() == 1);
    printf("PASS: test_silent_sources_skip_extraction\n");
}

void test_both_speakers_with_audio_are_mixed_and_muxed() {
    Fixture fx(1.0, 25.0, 1.0, 25.0, true, true);
    FakeProcessRunner runner;
    runner.audioAvailable = true;
    RecordingLogger logger;

    ExportPipeline pipeline(fx.layout, fx.target, softwarePlan(), runner, logger, "ffmpeg");
    bool ok = pipeline.run(fx.inputs);
    if (!ok) printf("FAIL: %s\n", pipeline.errorString().toUtf8().constData());
    assert(ok);

    assert(extractionCalls(runner) == 2);
    assert(pipeline.stats().hasAudio);
    assert(pipeline.stats().encoderUsed == "libx264");

    const QStringList& mux = runner.calls.back();
    assert(mux.count("-i") == 2);
    assert(mux.value(3).endsWith("mixed.wav"));
    const int audioCodec = mux.indexOf("-c:a");
    assert(audioCodec >= 0);
    assert(mux.value(audioCodec + 1) == "aac");
    assert(mux.value(audioCodec + 2) == "-b:a");
    assert(mux.value(audioCodec + 3) == "128k");
    assert(mux.contains("-shortest"));

    // The mixed track covers the whole output at 44.1 kHz mono 16-bit
    const qint64 expectedBytes = 44 + 2 * static_cast<qint64>(
        std::llround(pipeline.timeline().duration() * 44100));
    assert(std::llabs(runner.lastMuxAudioSize - expectedBytes) <= 4);
    assert(QFileInfo(fx.inputs.outputPath).size() > 0);
    printf("PASS: test_both_speakers_with_audio_are_mixed_and_muxed\n");
}

void test_one_speaker_with_audio() {
    Fixture fx(1.0, 25.0, 1.0, 25.0, true, false);
    FakeProcessRunner runner;
    runner.audioAvailable = true;
    RecordingLogger logger;

    ExportPipeline pipeline(fx.layout, fx.target, softwarePlan(), runner, logger, "ffmpeg");
    assert(pipeline.run(fx.inputs));

    // The silent speaker is recognized by probing, not by a failed extraction
    assert(extractionCalls(runner) == 1);
    bool extractedSpeaker1 = false;
    for (const QStringList& call : runner.calls)
        extractedSpeaker1 = extractedSpeaker1 ||
            (call.contains("-vn") && call.value(1) == fx.inputs.speaker1Path);
    assert(extractedSpeaker1);

    assert(pipeline.stats().hasAudio);
    const QStringList& mux = runner.calls.back();
    assert(mux.count("-i") == 2);
    assert(mux.contains("-c:a"));
    assert(runner.lastMuxAudioSize > 44);
    printf("PASS: test_one_speaker_with_audio\n");
}

void test_all_encoders_fail_drops_audio() {
    Fixture fx(1.0, 25.0, 1.0, 25.0, true, true);
    FakeProcessRunner runner;
    runner.audioAvailable = true;
    runner.failingCodecs << "h264_nvenc" << "libx264";
    RecordingLogger logger;

    ExportPipeline pipeline(fx.layout, fx.target, nvencPlan(), runner, logger, "ffmpeg");
    assert(pipeline.run(fx.inputs));
    assert(runner.muxCodecs == QStringList({ "h264_nvenc", "libx264" }));

    // Both attempts carried the audio, the published file is the silent intermediate
    int muxWithAudio = 0;
    for (const QStringList& call : runner.calls)
        if (call.contains("-c:v") && call.count("-i") == 2) ++muxWithAudio;
    assert(muxWithAudio == 2);
    assert(!pipeline.stats().hasAudio);
    assert(pipeline.stats().encoderUsed.isEmpty());

    QFile output(fx.inputs.outputPath);
    assert(output.open(QIODevice::ReadOnly));
    const QByteArray published = output.readAll();
    assert(!published.isEmpty());
    assert(published == runner.lastMuxInput);

    MediaProbe probe;
    assert(probe.probe(fx.inputs.outputPath));
    assert(probe.info().hasVideo());
    assert(!probe.info().hasAudio());
    printf("PASS: test_all_encoders_fail_drops_audio\n");
}

void test_unreadable_background_is_fatal() {
    Fixture fx(1.0, 25.0, 1.0, 25.0);
    QFile broken(fx.inputs.backgroundPath);
    assert(broken.open(QIODevice::WriteOnly | QIODevice::Truncate));
    broken.write("not an image");
    broken.close();

    FakeProcessRunner runner;
    RecordingLogger logger;
    ExportPipeline pipeline(fx.layout, fx.target, softwarePlan(), runner, logger, "ffmpeg");
    QString failure;
    QObject::connect(&pipeline, &ExportPipeline::finished,
                     [&failure](bool ok, const QString& message) { if (!ok) failure = message; });

    assert(!pipeline.run(fx.inputs));
    assert(!pipeline.errorString().isEmpty());
    assert(failure == pipeline.errorString());
    assert(!logger.errors.isEmpty());
    assert(pipeline.progressValue() < 100);
    assert(!QFile::exists(fx.inputs.outputPath));
    assert(runner.calls.empty());
    printf("PASS: test_unreadable_background_is_fatal\n");
}

void test_unopenable_source_is_fatal() {
    Fixture fx(1.0, 25.0, 1.0, 25.0);
    fx.inputs.speaker2Path = fx.dir.filePath("missing.mp4");

    FakeProcessRunner runner;
    RecordingLogger logger;
    ExportPipeline pipeline(fx.layout, fx.target, softwarePlan(), runner, logger, "ffmpeg");
    assert(!pipeline.run(fx.inputs));
    assert(!QFile::exists(fx.inputs.outputPath));
    printf("PASS: test_unopenable_source_is_fatal\n");
}

void test_existing_output_is_replaced() {
    Fixture fx(1.0, 25.0, 1.0, 25.0);
    assert(QDir().mkpath(QFileInfo(fx.inputs.outputPath).absolutePath()));
    QFile stale(fx.inputs.outputPath);
    assert(stale.open(QIODevice::WriteOnly));
    stale.write("stale");
    stale.close();

    FakeProcessRunner runner;
    RecordingLogger logger;
    ExportPipeline pipeline(fx.layout, fx.target, softwarePlan(), runner, logger, "ffmpeg");
    assert(pipeline.run(fx.inputs));
    assert(QFileInfo(fx.inputs.outputPath).size() > 5);
    printf("PASS: test_existing_output_is_replaced\n");
}

void test_preview_writes_jpeg() {
    Fixture fx(1.0, 25.0, 1.0, 25.0);
    FakeProcessRunner runner;
    RecordingLogger logger;

    ExportPipeline pipeline(fx.layout, fx.target, softwarePlan(), runner, logger, "ffmpeg");
    const QString jpeg = fx.dir.filePath("preview/first.jpg");
    assert(pipeline.renderPreview(fx.inputs, jpeg));

    QImage preview(jpeg);
    assert(preview.size() == QSize(320, 240));
    auto boxes = pipeline.layout().speakerBoxes(fx.target.size());
    assert(colorNear(preview.pixel(boxes.first.center()), Speaker1Color, 40));
    assert(colorNear(preview.pixel(boxes.second.center()), Speaker2Color, 40));
    assert(runner.calls.empty());
    printf("PASS: test_preview_writes_jpeg\n");
}

int main(int argc, char* argv[]) {
    QGuiApplication app(argc, argv);

    test_end_to_end_timeline();
    test_hardware_failure_falls_back_to_software();
    test_all_encoders_fail_publishes_intermediate();
    test_silent_sources_skip_extraction();
    test_both_speakers_with_audio_are_mixed_and_muxed();
    test_one_speaker_with_audio();
    test_all_encoders_fail_drops_audio();
    test_unreadable_background_is_fatal();
    test_unopenable_source_is_fatal();
    test_existing_output_is_replaced();
    test_preview_writes_jpeg();
    printf("All export pipeline tests passed.\n");
    return 0;
}
