#pragma once

#include <QColor>
#include <QImage>
#include <QSize>

namespace FrameScaler {
    // Size of the source once fitted into the target box. One axis matches the
    // box exactly, the other keeps the source aspect ratio.
    QSize fittedSize(const QSize& source, int targetWidth, int targetHeight);

    // Aspect-preserving resize onto a solid canvas of exactly the target size.
    QImage letterbox(const QImage& source, int targetWidth, int targetHeight,
                     const QColor& fill = Qt::black);

    // Plain resize to exactly the target size with a smooth filter
    QImage stretch(const QImage& source, const QSize& target);
}
