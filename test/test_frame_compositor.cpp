#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <QGuiApplication>
#include "TestSupport.h"
#include "overlay/FrameCompositor.h"
#include "config/SpeakerLayout.h"

namespace {

SpeakerLayout smallLayout() {
    SpeakerLayout layout;
    layout.width = 120;
    layout.height = 90;
    return layout.clampedTo(QSize(320, 240));
}

QImage solid(int w, int h, const QColor& color) {
    QImage image(w, h, QImage::Format_RGB32);
    image.fill(color);
    return image;
}

} // namespace

void test_auto_boxes_are_disjoint_and_inside() {
    const QSize outputs[] = { QSize(1920, 1080), QSize(320, 240), QSize(801, 601) };
    for (const QSize& out : outputs) {
        SpeakerLayout layout;
        layout.width = out.width() / 2;
        layout.height = out.height() / 2;
        assert(layout.validate(out));

        auto boxes = layout.speakerBoxes(out);
        const QRect frame(QPoint(0, 0), out);
        assert(frame.contains(boxes.first));
        assert(frame.contains(boxes.second));
        assert(!boxes.first.intersects(boxes.second));
        assert(boxes.first.y() == boxes.second.y());
    }

    SpeakerLayout defaults;
    auto boxes = defaults.speakerBoxes(QSize(1920, 1080));
    assert(boxes.first == QRect(280, 390, 400, 300));
    assert(boxes.second == QRect(1240, 390, 400, 300));
    printf("PASS: test_auto_boxes_are_disjoint_and_inside\n");
}

void test_fixed_position_mirrors_second_speaker() {
    SpeakerLayout layout;
    layout.width = 120;
    layout.height = 90;
    layout.hasFixedPosition = true;
    layout.fixedPosition = QPoint(10, 20);

    auto boxes = layout.speakerBoxes(QSize(320, 240));
    assert(boxes.first == QRect(10, 20, 120, 90));
    assert(boxes.second == QRect(190, 20, 120, 90));
    assert(layout.validate(QSize(320, 240)));

    layout.fixedPosition = QPoint(100, 20);
    QString error;
    assert(!layout.validate(QSize(320, 240), &error));
    assert(!error.isEmpty());
    printf("PASS: test_fixed_position_mirrors_second_speaker\n");
}

void test_compose_both_speakers() {
    RecordingLogger logger;
    FrameCompositor compositor(smallLayout(), QSize(320, 240), logger);
    compositor.setBackground(solid(100, 100, QColor(0, 0, 200)));

    QImage frame = compositor.compose(SourceFrame::frame(solid(64, 48, Qt::red)),
                                      SourceFrame::frame(solid(64, 48, Qt::green)),
                                      "Alice", "Bob");
    assert(frame.size() == QSize(320, 240));

    const QRect box1 = compositor.speaker1Box();
    const QRect box2 = compositor.speaker2Box();
    assert(frame.pixel(box1.center()) == qRgb(255, 0, 0));
    assert(frame.pixel(box2.center()) == qRgb(0, 255, 0));
    assert(frame.pixel(2, 2) == qRgb(0, 0, 200));

    // Plate border starts five pixels below each box
    const int plateTop = box1.y() + box1.height() + 5;
    assert(frame.pixel(box1.center().x(), plateTop) == qRgb(255, 255, 255));
    assert(frame.pixel(box2.center().x(), plateTop) == qRgb(255, 255, 255));
    assert(frame.pixel(box1.center().x(), plateTop - 2) == qRgb(0, 0, 200));
    assert(logger.warnings.isEmpty());
    printf("PASS: test_compose_both_speakers\n");
}

void test_absent_speaker_leaves_background() {
    RecordingLogger logger;
    FrameCompositor compositor(smallLayout(), QSize(320, 240), logger);
    compositor.setBackground(solid(100, 100, QColor(0, 0, 200)));

    const QRect box2 = compositor.speaker2Box();
    const int plateTop = box2.y() + box2.height() + 5;

    const SourceFrame absent[] = { SourceFrame::exhausted(), SourceFrame::readError() };
    for (const SourceFrame& missing : absent) {
        QImage frame = compositor.compose(SourceFrame::frame(solid(64, 48, Qt::red)), missing,
                                          "Alice", "Bob");
        assert(frame.pixel(box2.center()) == qRgb(0, 0, 200));
        assert(frame.pixel(box2.center().x(), plateTop) == qRgb(0, 0, 200));
        assert(frame.pixel(compositor.speaker1Box().center()) == qRgb(255, 0, 0));
    }
    printf("PASS: test_absent_speaker_leaves_background\n");
}

void test_empty_name_draws_no_plate() {
    RecordingLogger logger;
    FrameCompositor compositor(smallLayout(), QSize(320, 240), logger);
    compositor.setBackground(solid(100, 100, QColor(0, 0, 200)));

    QImage frame = compositor.compose(SourceFrame::frame(solid(64, 48, Qt::red)),
                                      SourceFrame::exhausted(), QString(), QString());
    const QRect box1 = compositor.speaker1Box();
    assert(frame.pixel(box1.center().x(), box1.y() + box1.height() + 5) == qRgb(0, 0, 200));
    printf("PASS: test_empty_name_draws_no_plate\n");
}

void test_overflowing_plate_is_omitted() {
    SpeakerLayout layout;
    layout.width = 120;
    layout.height = 90;
    const QSize output(320, 140);
    layout = layout.clampedTo(output);

    RecordingLogger logger;
    FrameCompositor compositor(layout, output, logger);
    compositor.setBackground(solid(10, 10, QColor(0, 0, 200)));

    QImage frame = compositor.compose(SourceFrame::frame(solid(64, 48, Qt::red)),
                                      SourceFrame::exhausted(), "Alice", "Bob");
    const QRect box1 = compositor.speaker1Box();
    assert(frame.pixel(box1.center()) == qRgb(255, 0, 0));
    assert(frame.pixel(box1.center().x(), box1.y() + box1.height() + 5) == qRgb(0, 0, 200));
    assert(logger.warnings.size() == 1);

    // Warned once per speaker, not once per frame
    compositor.compose(SourceFrame::frame(solid(64, 48, Qt::red)),
                       SourceFrame::exhausted(), "Alice", "Bob");
    assert(logger.warnings.size() == 1);
    printf("PASS: test_overflowing_plate_is_omitted\n");
}

int countContaining(const QStringList& messages, const QString& needle) {
    int count = 0;
    for (const QString& m : messages)
        if (m.contains(needle)) ++count;
    return count;
}

void test_warnings_are_tracked_per_condition() {
    RecordingLogger logger;

    // Boxes fit, plates below them do not
    SpeakerLayout tight;
    tight.width = 120;
    tight.height = 90;
    tight.hasFixedPosition = true;
    tight.fixedPosition = QPoint(10, 40);
    FrameCompositor plates(tight.clampedTo(QSize(320, 140)), QSize(320, 140), logger);
    for (int i = 0; i < 3; ++i)
        plates.compose(SourceFrame::frame(solid(64, 48, Qt::red)),
                       SourceFrame::frame(solid(64, 48, Qt::green)), "Alice", "Bob");
    assert(countContaining(logger.warnings, "Name plate") == 2);
    assert(countContaining(logger.warnings, "outside the output frame") == 0);

    // Boxes hang below the frame
    SpeakerLayout low = tight;
    low.fixedPosition = QPoint(10, 100);
    FrameCompositor boxes(low.clampedTo(QSize(320, 140)), QSize(320, 140), logger);
    for (int i = 0; i < 3; ++i)
        boxes.compose(SourceFrame::frame(solid(64, 48, Qt::red)),
                      SourceFrame::frame(solid(64, 48, Qt::green)), "Alice", "Bob");
    assert(countContaining(logger.warnings, "outside the output frame") == 2);
    assert(countContaining(logger.warnings, "Name plate") == 2);
    assert(logger.warnings.size() == 4);
    printf("PASS: test_warnings_are_tracked_per_condition\n");
}

void test_no_background_is_black() {
    RecordingLogger logger;
    FrameCompositor compositor(smallLayout(), QSize(320, 240), logger);
    assert(!compositor.hasBackground());
    QImage frame = compositor.compose(SourceFrame::exhausted(), SourceFrame::exhausted(),
                                      "Alice", "Bob");
    assert(frame.size() == QSize(320, 240));
    assert(frame.pixel(160, 120) == qRgb(0, 0, 0));
    printf("PASS: test_no_background_is_black\n");
}

int main(int argc, char* argv[]) {
    QGuiApplication app(argc, argv);

    test_auto_boxes_are_disjoint_and_inside();
    test_fixed_position_mirrors_second_speaker();
    test_compose_both_speakers();
    test_absent_speaker_leaves_background();
    test_empty_name_draws_no_plate();
    test_overflowing_plate_is_omitted();
    test_warnings_are_tracked_per_condition();
    test_no_background_is_black();
    printf("All frame compositor tests passed.\n");
    return 0;
}
