#pragma once

#include <QColor>
#include <QPoint>
#include <QRect>
#include <QSize>
#include <QString>
#include <utility>

// Geometry and name plate styling shared by both speakers.
struct SpeakerLayout {
    int width = 400;
    int height = 300;

    // Auto-centering in each speaker's half of the frame unless set
    bool hasFixedPosition = false;
    QPoint fixedPosition;

    int fontSize = 24;            // pixels
    QString fontFamily;           // optional family name
    QString fontPath;             // optional font file, takes precedence
    QColor fontColor = Qt::white;
    QColor plateBackground = QColor(0, 0, 0, 180);
    QColor plateBorderColor = Qt::white;
    int plateBorderWidth = 2;
    int platePadding = 10;

    static constexpr int MaxDimension = 4096;
    static constexpr int MaxFontSize = 200;
    static constexpr int MaxBorderWidth = 20;

    bool validate(const QSize& outputSize, QString* error = nullptr) const;

    // Copy with padding and font size clamped to ranges derived from the
    // output and speaker heights.
    SpeakerLayout clampedTo(const QSize& outputSize) const;

    // Speaker boxes for speaker 1 and speaker 2 inside the output frame
    std::pair<QRect, QRect> speakerBoxes(const QSize& outputSize) const;

    static int clampPadding(int outputHeight, int requestedPadding);
    static int clampFontSize(int speakerHeight, int requestedFontSize);
};
