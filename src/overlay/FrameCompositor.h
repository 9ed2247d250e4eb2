#pragma once

#include <QHash>
#include <QImage>
#include <QRect>
#include <QSize>
#include <QString>
#include "ImageCompositor.h"
#include "SourceFrame.h"
#include "SpeakerLayout.h"

class JobLogger;

// Builds one output frame: scaled background, two letterboxed speakers and
// their name plates. Geometry and the background are prepared once per job.
class FrameCompositor {
public:
    FrameCompositor(const SpeakerLayout& layout, const QSize& outputSize, JobLogger& logger);

    void setBackground(const QImage& background);
    bool hasBackground() const { return !m_background.isNull(); }

    QImage compose(const SourceFrame& speaker1, const SourceFrame& speaker2,
                   const QString& name1, const QString& name2);

    const QRect& speaker1Box() const { return m_box1; }
    const QRect& speaker2Box() const { return m_box2; }
    const QSize& outputSize() const { return m_outputSize; }

private:
    // Each condition is reported once per speaker and job
    struct SpeakerWarnings {
        bool boxOutside = false;
        bool plateOmitted = false;
    };

    void drawSpeaker(QImage& canvas, const SourceFrame& frame, const QRect& box,
                     const QString& name, SpeakerWarnings& warned);
    const QImage& plateFor(const QString& name, int minWidth);

    SpeakerLayout m_layout;
    QSize m_outputSize;
    JobLogger& m_logger;
    ImageCompositor m_images;

    QRect m_box1;
    QRect m_box2;
    QImage m_background;
    QHash<QString, QImage> m_plates;
    SpeakerWarnings m_warned1;
    SpeakerWarnings m_warned2;
};
