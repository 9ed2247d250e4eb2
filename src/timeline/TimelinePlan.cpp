#include "TimelinePlan.h"
#include "VideoDecoder.h"
#include <algorithm>

double TimelinePlan::calculateOutputFps(double fps1, double fps2, double requestedFps) {
    double result = 0.0;
    for (double fps : { fps1, fps2, requestedFps }) {
        if (fps <= 0.0) continue;
        result = (result > 0.0) ? std::min(result, fps) : fps;
    }
    return result;
}

int64_t TimelinePlan::calculateMaxFrames(int64_t frames1, int64_t frames2) {
    return std::max<int64_t>(0, std::max(frames1, frames2));
}

TimelinePlan TimelinePlan::fromStreams(const VideoInfo& first, const VideoInfo& second,
                                       double requestedFps) {
    TimelinePlan plan;
    plan.fps = calculateOutputFps(first.fps, second.fps, requestedFps);
    plan.frameCount = calculateMaxFrames(first.totalFrames, second.totalFrames);
    return plan;
}
