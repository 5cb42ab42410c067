#pragma once

#include <functional>
#include <string>

/**
 * @brief Snapshot of a running encode
 */
struct Progress
{
    double fraction = 0.0;         // 0..1 of the expected duration
    double processed_seconds = 0.0; // Media time written so far
    double speed = 0.0;            // Multiple of real time, 0 when unknown
    double eta_seconds = -1.0;     // Estimated wall time remaining, -1 when unknown
    long frames = 0;
    std::string bitrate;           // As reported by the encoder, e.g. "2300.1kbits/s"
    bool finished = false;         // Encoder reported the end of its output

    std::string toString() const
    {
        return "Progress{" + std::to_string(static_cast<int>(fraction * 100.0)) + "% at " +
               std::to_string(processed_seconds) + "s speed=" + std::to_string(speed) + "x}";
    }
};

using ProgressCallback = std::function<void(const Progress &)>;
