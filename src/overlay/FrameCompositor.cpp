#include "FrameCompositor.h"
#include "AppConstants.h"
#include "FrameScaler.h"
#include "JobLogger.h"
#include <QPainter>

FrameCompositor::FrameCompositor(const SpeakerLayout& layout, const QSize& outputSize,
                                 JobLogger& logger)
    : m_layout(layout)
    , m_outputSize(outputSize)
    , m_logger(logger)
    , m_images(layout, logger)
{
    auto boxes = m_layout.speakerBoxes(m_outputSize);
    m_box1 = boxes.first;
    m_box2 = boxes.second;
}

void FrameCompositor::setBackground(const QImage& background) {
    m_background = FrameScaler::stretch(background, m_outputSize);
}

QImage FrameCompositor::compose(const SourceFrame& speaker1, const SourceFrame& speaker2,
                                const QString& name1, const QString& name2) {
    QImage canvas;
    if (m_background.isNull()) {
        canvas = QImage(m_outputSize, QImage::Format_RGB32);
        canvas.fill(Qt::black);
    } else {
        canvas = m_background.copy();
    }

    drawSpeaker(canvas, speaker1, m_box1, name1, m_warned1);
    drawSpeaker(canvas, speaker2, m_box2, name2, m_warned2);
    return canvas;
}

void FrameCompositor::drawSpeaker(QImage& canvas, const SourceFrame& frame, const QRect& box,
                                  const QString& name, SpeakerWarnings& warned) {
    switch (frame.state) {
    case SourceFrame::State::Exhausted:
    case SourceFrame::State::ReadError:
        return;
    case SourceFrame::State::Frame:
        break;
    }
    if (frame.image.isNull()) return;

    if (!canvas.rect().contains(box)) {
        if (!warned.boxOutside) {
            m_logger.warning(QString("Speaker box %1,%2 %3x%4 lies outside the output frame, skipped")
                                 .arg(box.x()).arg(box.y()).arg(box.width()).arg(box.height()));
            warned.boxOutside = true;
        }
        return;
    }

    QImage fitted = FrameScaler::letterbox(frame.image, box.width(), box.height());
    QPainter painter(&canvas);
    painter.setCompositionMode(QPainter::CompositionMode_Source);
    painter.drawImage(box.topLeft(), fitted);
    painter.end();

    if (name.isEmpty()) return;

    const QImage& plate = plateFor(name, box.width());
    int plateX = box.x() + (box.width() - plate.width()) / 2;
    int plateY = box.y() + box.height() + AppConstants::NamePlateGap;
    if (!ImageCompositor::overlay(canvas, plate, plateX, plateY) && !warned.plateOmitted) {
        m_logger.warning(QString("Name plate for \"%1\" does not fit in the output frame, omitted")
                             .arg(name));
        warned.plateOmitted = true;
    }
}

const QImage& FrameCompositor::plateFor(const QString& name, int minWidth) {
    auto it = m_plates.find(name);
    if (it == m_plates.end())
        it = m_plates.insert(name, m_images.renderNamePlate(name, minWidth));
    return it.value();
}
