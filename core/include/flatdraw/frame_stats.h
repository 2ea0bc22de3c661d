#pragma once

// flatdraw - Frame Statistics
// Drawn-frame counter with a periodic FPS / frame time report

namespace flatdraw {

class FrameStats {
public:
    static constexpr double REPORT_INTERVAL = 1.0;  // Seconds between reports

    /**
     * @brief Record a drawn frame finishing at `now` (seconds, monotonic)
     * @return true when a new report is ready in fps() / frameTimeMs()
     */
    bool frame(double now);

    int frames() const { return m_frames; }
    double fps() const { return m_fps; }
    double frameTimeMs() const { return m_frameTimeMs; }

private:
    int m_frames = 0;
    int m_intervalFrames = 0;
    double m_intervalStart = 0.0;
    double m_fps = 0.0;
    double m_frameTimeMs = 0.0;
};

} // namespace flatdraw
