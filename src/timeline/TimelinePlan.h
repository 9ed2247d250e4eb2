#pragma once

#include <cstdint>
#include "TimeUtil.h"

struct VideoInfo;

// Output timing shared by both speaker streams. Frame i of the output pulls
// the i-th frame of each stream; a stream that runs out is simply absent.
struct TimelinePlan {
    double fps = 0.0;
    int64_t frameCount = 0;

    double duration() const { return TimeUtil::frameToSeconds(frameCount, fps); }
    bool isEmpty() const { return frameCount <= 0 || fps <= 0.0; }

    // Lowest positive rate among the two streams and the requested rate
    static double calculateOutputFps(double fps1, double fps2, double requestedFps);
    static int64_t calculateMaxFrames(int64_t frames1, int64_t frames2);

    static TimelinePlan fromStreams(const VideoInfo& first, const VideoInfo& second,
                                    double requestedFps);
};
