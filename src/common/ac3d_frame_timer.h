//
// AC3D
//

#pragma once

#include <chrono>
#include <stdint.h>

namespace AC3D {
    typedef std::chrono::steady_clock::time_point Timestamp;

    struct Timer {
        static Timestamp current();
        static int64_t deltaMicroseconds(const Timestamp t1, const Timestamp t2);
    };

    // Measures the time between consecutive frames of the host's render loop.
    struct FrameTimer {
        // Longest frame step handed to the controller. Loading screens and debugger breaks would otherwise
        // be seen as a single huge step.
        static const double MaxDeltaSeconds;

        Timestamp lastTime;
        bool started = false;

        FrameTimer();
        void reset();

        // Returns the elapsed seconds since the previous call. The first call after a reset returns zero.
        double tick();
        double tick(const Timestamp now);
    };
};
