#include "SpeakerLayout.h"
#include "AppConstants.h"
#include <algorithm>

namespace {

bool fail(QString* error, const QString& message) {
    if (error) *error = message;
    return false;
}

} // namespace

bool SpeakerLayout::validate(const QSize& outputSize, QString* error) const {
    if (width < 1 || width > MaxDimension || height < 1 || height > MaxDimension)
        return fail(error, QString("Speaker size %1x%2 is outside 1..%3")
                               .arg(width).arg(height).arg(MaxDimension));
    if (fontSize < 1 || fontSize > MaxFontSize)
        return fail(error, QString("Font size %1 is outside 1..%2").arg(fontSize).arg(MaxFontSize));
    if (plateBorderWidth < 0 || plateBorderWidth > MaxBorderWidth)
        return fail(error, QString("Plate border width %1 is outside 0..%2")
                               .arg(plateBorderWidth).arg(MaxBorderWidth));
    if (platePadding < 0 || platePadding > AppConstants::PaddingUpperLimit)
        return fail(error, QString("Plate padding %1 is outside 0..%2")
                               .arg(platePadding).arg(AppConstants::PaddingUpperLimit));
    if (!fontColor.isValid() || !plateBackground.isValid() || !plateBorderColor.isValid())
        return fail(error, "Invalid name plate color");

    if (height > outputSize.height())
        return fail(error, QString("Speaker height %1 exceeds output height %2")
                               .arg(height).arg(outputSize.height()));

    if (!hasFixedPosition) {
        // Each speaker is centered in its own half of the frame
        if (width > outputSize.width() / 2)
            return fail(error, QString("Speaker width %1 exceeds half of output width %2")
                                   .arg(width).arg(outputSize.width()));
        return true;
    }

    if (width > outputSize.width())
        return fail(error, QString("Speaker width %1 exceeds output width %2")
                               .arg(width).arg(outputSize.width()));
    if (fixedPosition.x() < 0 || fixedPosition.y() < 0)
        return fail(error, "Fixed speaker position must not be negative");

    const QRect frame(QPoint(0, 0), outputSize);
    auto boxes = speakerBoxes(outputSize);
    if (!frame.contains(boxes.first) || !frame.contains(boxes.second))
        return fail(error, "Fixed speaker position places a speaker outside the output frame");
    if (boxes.first.intersects(boxes.second))
        return fail(error, "Fixed speaker position makes the speakers overlap");
    return true;
}

SpeakerLayout SpeakerLayout::clampedTo(const QSize& outputSize) const {
    SpeakerLayout clamped = *this;
    clamped.platePadding = clampPadding(outputSize.height(), platePadding);
    clamped.fontSize = clampFontSize(height, fontSize);
    return clamped;
}

std::pair<QRect, QRect> SpeakerLayout::speakerBoxes(const QSize& outputSize) const {
    const QSize box(width, height);

    if (hasFixedPosition) {
        // Speaker 2 mirrors speaker 1 around the vertical center line
        QPoint second(outputSize.width() - fixedPosition.x() - width, fixedPosition.y());
        return { QRect(fixedPosition, box), QRect(second, box) };
    }

    int halfWidth = outputSize.width() / 2;
    int y = (outputSize.height() - height) / 2;
    int x1 = (halfWidth - width) / 2;
    int x2 = halfWidth + (halfWidth - width) / 2;
    return { QRect(QPoint(x1, y), box), QRect(QPoint(x2, y), box) };
}

int SpeakerLayout::clampPadding(int outputHeight, int requestedPadding) {
    int minPadding = std::max(2, static_cast<int>(outputHeight * 0.01));
    return std::max(minPadding, std::min(AppConstants::PaddingUpperLimit, requestedPadding));
}

int SpeakerLayout::clampFontSize(int speakerHeight, int requestedFontSize) {
    int minSize = std::max(12, static_cast<int>(speakerHeight * 0.04));
    int maxSize = std::max(minSize + 1, static_cast<int>(speakerHeight * 0.15));
    return std::max(minSize, std::min(maxSize, requestedFontSize));
}
