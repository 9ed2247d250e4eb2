#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <cmath>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include "TestSupport.h"
#include "audio/AudioExtractor.h"
#include "audio/AudioMixer.h"

void test_target_length() {
    assert(AudioMixer::targetLength(2.5, 44100) == 110250);
    assert(AudioMixer::targetLength(12.5, 44100) == 551250);
    assert(AudioMixer::targetLength(0.0, 44100) == 0);
    assert(AudioMixer::targetLength(1.0, 0) == 0);
    printf("PASS: test_target_length\n");
}

void test_both_absent_is_absent() {
    AudioBuffer mixed = AudioMixer::mix(AudioBuffer::absent(), AudioBuffer::absent(), 3.0);
    assert(!mixed.present);
    assert(mixed.samples.empty());
    printf("PASS: test_both_absent_is_absent\n");
}

void test_short_track_is_padded_and_normalized() {
    std::vector<float> samples(44100, 0.25f);
    samples[100] = -0.5f;

    AudioBuffer mixed = AudioMixer::mix(AudioBuffer::fromSamples(samples), AudioBuffer::absent(), 2.0);
    assert(mixed.present);
    assert(mixed.samples.size() == 88200);
    assert(std::abs(AudioMixer::peak(mixed.samples) - 0.8f) < 1e-5f);
    assert(std::abs(mixed.samples[100] + 0.8f) < 1e-5f);
    assert(std::abs(mixed.samples[0] - 0.4f) < 1e-5f);
    // Padding past the end of the source stays silent
    assert(mixed.samples[44100] == 0.0f);
    assert(mixed.samples.back() == 0.0f);
    printf("PASS: test_short_track_is_padded_and_normalized\n");
}

void test_long_track_is_truncated() {
    std::vector<float> first(44100 * 3, 0.1f);
    std::vector<float> second(44100 / 2, 0.1f);

    AudioBuffer mixed = AudioMixer::mix(AudioBuffer::fromSamples(first),
                                        AudioBuffer::fromSamples(second), 1.0);
    assert(mixed.samples.size() == 44100);
    // Overlap sums to 0.2 and becomes the peak, the rest is half of it
    assert(std::abs(mixed.samples[0] - 0.8f) < 1e-5f);
    assert(std::abs(mixed.samples[30000] - 0.4f) < 1e-5f);
    printf("PASS: test_long_track_is_truncated\n");
}

void test_silence_stays_zero() {
    std::vector<float> silence(1000, 0.0f);
    AudioBuffer mixed = AudioMixer::mix(AudioBuffer::fromSamples(silence),
                                        AudioBuffer::fromSamples(silence), 0.5);
    assert(mixed.present);
    assert(mixed.samples.size() == 22050);
    for (float s : mixed.samples) assert(s == 0.0f);
    printf("PASS: test_silence_stays_zero\n");
}

void test_extractor_loads_decoded_track() {
    QTemporaryDir dir;
    assert(dir.isValid());

    // Any file with an audio stream works as a source
    const QString source = dir.filePath("source.wav");
    std::vector<float> tone(4410, 0.3f);
    assert(WavWriter::writeMono16(source, tone, 44100));

    FakeProcessRunner runner;
    runner.audioAvailable = true;
    runner.audioSeconds = 2.0;
    RecordingLogger logger;

    AudioExtractor extractor(runner, logger, "ffmpeg", 4);
    const QString wav = dir.filePath("out.wav");
    AudioBuffer buffer = extractor.extract(source, wav);

    assert(buffer.present);
    assert(buffer.sampleRate == 44100);
    assert(std::abs(static_cast<long>(buffer.samples.size()) - 88200) <= 64);
    assert(!QFile::exists(wav));

    assert(runner.calls.size() == 1);
    assert(runner.calls[0] == AudioExtractor::extractionArguments(source, wav, 44100, 4));
    QStringList expected{ "-i", source, "-vn", "-acodec", "pcm_s16le", "-ar", "44100",
                          "-ac", "1", "-threads", "4", "-y", wav };
    assert(runner.calls[0] == expected);
    printf("PASS: test_extractor_loads_decoded_track\n");
}

void test_extractor_failure_is_absent() {
    QTemporaryDir dir;
    const QString source = dir.filePath("source.wav");
    std::vector<float> tone(4410, 0.3f);
    assert(WavWriter::writeMono16(source, tone, 44100));

    FakeProcessRunner runner;
    runner.audioAvailable = false;
    RecordingLogger logger;

    AudioExtractor extractor(runner, logger, "ffmpeg");
    AudioBuffer buffer = extractor.extract(source, dir.filePath("out.wav"));
    assert(!buffer.present);
    assert(!logger.warnings.isEmpty());
    assert(logger.errors.isEmpty());
    printf("PASS: test_extractor_failure_is_absent\n");
}

void test_extractor_skips_silent_video() {
    QTemporaryDir dir;
    const QString video = dir.filePath("silent.mp4");
    assert(writeSolidVideo(video, 64, 48, 25.0, 10, Qt::red));

    FakeProcessRunner runner;
    runner.audioAvailable = true;
    RecordingLogger logger;

    AudioExtractor extractor(runner, logger, "ffmpeg");
    AudioBuffer buffer = extractor.extract(video, dir.filePath("out.wav"));
    assert(!buffer.present);
    assert(runner.calls.empty());
    printf("PASS: test_extractor_skips_silent_video\n");
}

int main() {
    test_target_length();
    test_both_absent_is_absent();
    test_short_track_is_padded_and_normalized();
    test_long_track_is_truncated();
    test_silence_stays_zero();
    test_extractor_loads_decoded_track();
    test_extractor_failure_is_absent();
    test_extractor_skips_silent_video();
    printf("All audio mixer tests passed.\n");
    return 0;
}
