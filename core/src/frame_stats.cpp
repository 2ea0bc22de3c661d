// flatdraw - Frame Statistics Implementation

#include <flatdraw/frame_stats.h>

namespace flatdraw {

bool FrameStats::frame(double now) {
    ++m_frames;

    // The first frame only starts the clock
    if (m_frames == 1) {
        m_intervalStart = now;
        return false;
    }

    ++m_intervalFrames;
    double elapsed = now - m_intervalStart;
    if (elapsed < REPORT_INTERVAL) {
        return false;
    }

    m_fps = m_intervalFrames / elapsed;
    m_frameTimeMs = 1000.0 * elapsed / m_intervalFrames;
    m_intervalStart = now;
    m_intervalFrames = 0;
    return true;
}

} // namespace flatdraw
