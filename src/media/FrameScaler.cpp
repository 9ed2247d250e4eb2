#include "FrameScaler.h"
#include <QPainter>
#include <algorithm>

namespace FrameScaler {

QSize fittedSize(const QSize& source, int targetWidth, int targetHeight) {
    if (source.isEmpty() || targetWidth <= 0 || targetHeight <= 0)
        return QSize(std::max(0, targetWidth), std::max(0, targetHeight));

    double aspect = static_cast<double>(source.width()) / source.height();
    double targetAspect = static_cast<double>(targetWidth) / targetHeight;

    int width = targetWidth;
    int height = targetHeight;
    if (targetAspect > aspect) {
        // Box is wider than the source: fill height, pad left and right
        width = static_cast<int>(targetHeight * aspect);
    } else {
        // Fill width, pad top and bottom
        height = static_cast<int>(targetWidth / aspect);
    }
    return QSize(std::clamp(width, 1, targetWidth), std::clamp(height, 1, targetHeight));
}

QImage letterbox(const QImage& source, int targetWidth, int targetHeight, const QColor& fill) {
    QImage canvas(std::max(1, targetWidth), std::max(1, targetHeight), QImage::Format_RGB32);
    canvas.fill(fill);
    if (source.isNull() || targetWidth <= 0 || targetHeight <= 0) return canvas;

    QSize fitted = fittedSize(source.size(), targetWidth, targetHeight);
    QImage scaled = source.scaled(fitted, Qt::IgnoreAspectRatio, Qt::SmoothTransformation);

    int xOffset = (targetWidth - fitted.width()) / 2;
    int yOffset = (targetHeight - fitted.height()) / 2;

    QPainter p(&canvas);
    p.setCompositionMode(QPainter::CompositionMode_Source);
    p.drawImage(xOffset, yOffset, scaled);
    p.end();

    return canvas;
}

QImage stretch(const QImage& source, const QSize& target) {
    QImage scaled = source.scaled(target, Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
    if (scaled.format() != QImage::Format_RGB32)
        scaled = scaled.convertToFormat(QImage::Format_RGB32);
    return scaled;
}

} // namespace FrameScaler
