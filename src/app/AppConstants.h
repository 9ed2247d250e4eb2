#pragma once

namespace AppConstants {
    inline constexpr const char* AppName = "MeetingComposer";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "MeetingComposer";

    // External encoder binary used for audio extraction and final muxing
    inline constexpr const char* DefaultFfmpegProgram = "ffmpeg";
    inline constexpr const char* SoftwareVideoCodec = "libx264";

    // Audio is always processed as mono at this rate
    inline constexpr int AudioSampleRate = 44100;
    inline constexpr double MixHeadroomPeak = 0.8;

    // Audio track of the published file
    inline constexpr const char* MuxAudioCodec = "aac";
    inline constexpr const char* MuxAudioBitrate = "128k";

    // Name plate geometry
    inline constexpr int NamePlateMinHeight = 50;
    inline constexpr int NamePlateGap = 5;
    inline constexpr int PaddingUpperLimit = 50;

    // Progress checkpoints (percent)
    inline constexpr int ProgressAccepted = 2;
    inline constexpr int ProgressAudioReady = 10;
    inline constexpr int ProgressFramesDone = 90;
    inline constexpr int ProgressMuxing = 92;
    inline constexpr int ProgressComplete = 100;
}
