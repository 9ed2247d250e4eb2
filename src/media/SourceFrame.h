#pragma once

#include <QImage>

// Result of pulling one frame from a speaker stream.
struct SourceFrame {
    enum class State {
        Frame,      // image holds a decoded frame
        Exhausted,  // stream ended, no more frames will follow
        ReadError   // this step could not be decoded
    };

    State state = State::Exhausted;
    QImage image;

    static SourceFrame frame(const QImage& img) { return SourceFrame{State::Frame, img}; }
    static SourceFrame exhausted() { return SourceFrame{State::Exhausted, QImage()}; }
    static SourceFrame readError() { return SourceFrame{State::ReadError, QImage()}; }

    bool hasImage() const { return state == State::Frame && !image.isNull(); }
};
