//
// AC3D
//

#include "ac3d_frame_timer.h"

#include <algorithm>

namespace AC3D {
    // Timer

    Timestamp Timer::current() {
        return std::chrono::steady_clock::now();
    }

    int64_t Timer::deltaMicroseconds(const Timestamp t1, const Timestamp t2) {
        return std::chrono::duration_cast<std::chrono::microseconds>(t2 - t1).count();
    }

    // FrameTimer

    const double FrameTimer::MaxDeltaSeconds = 0.25;

    FrameTimer::FrameTimer() {
        reset();
    }

    void FrameTimer::reset() {
        lastTime = Timestamp();
        started = false;
    }

    double FrameTimer::tick() {
        return tick(Timer::current());
    }

    double FrameTimer::tick(const Timestamp now) {
        if (!started) {
            lastTime = now;
            started = true;
            return 0.0;
        }

        double deltaSeconds = static_cast<double>(Timer::deltaMicroseconds(lastTime, now)) / 1000000.0;
        lastTime = now;
        return std::clamp(deltaSeconds, 0.0, MaxDeltaSeconds);
    }
};
