#pragma once

#include <QString>
#include <cstdint>

namespace TimeUtil {

// "M:SS.mmm", or "H:MM:SS.mmm" once the value reaches an hour
inline QString secondsToHMS(double totalSeconds) {
    if (totalSeconds < 0.0) totalSeconds = 0.0;
    int64_t totalMillis = static_cast<int64_t>(totalSeconds * 1000.0 + 0.5);
    int hours = static_cast<int>(totalMillis / 3600000);
    int minutes = static_cast<int>((totalMillis / 60000) % 60);
    int seconds = static_cast<int>((totalMillis / 1000) % 60);
    int millis = static_cast<int>(totalMillis % 1000);

    if (hours > 0) {
        return QString("%1:%2:%3.%4")
            .arg(hours)
            .arg(minutes, 2, 10, QChar('0'))
            .arg(seconds, 2, 10, QChar('0'))
            .arg(millis, 3, 10, QChar('0'));
    }
    return QString("%1:%2.%3")
        .arg(minutes)
        .arg(seconds, 2, 10, QChar('0'))
        .arg(millis, 3, 10, QChar('0'));
}

// Frame index to presentation time at a constant rate
inline double frameToSeconds(int64_t frameIndex, double fps) {
    return fps > 0.0 ? static_cast<double>(frameIndex) / fps : 0.0;
}

} // namespace TimeUtil
