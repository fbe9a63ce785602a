//
// AC3D
//

#pragma once

#include <deque>
#include <stddef.h>
#include <stdint.h>

namespace AC3D {
    // Detects the popout bouncing back and forth instead of settling by counting how many times the
    // direction of change flips across a window of recent samples.
    struct JudderDetector {
        std::deque<float> history;
        uint32_t windowSize = 0;
        uint32_t signChangeThreshold = 0;

        JudderDetector();
        JudderDetector(uint32_t windowSize, uint32_t signChangeThreshold);
        void setup(uint32_t windowSize, uint32_t signChangeThreshold);
        void reset();

        // Adds a sample, evicting the oldest one if the window is full. Returns true if judder was detected.
        bool push(float popout);

        // Samples equal to their predecessor don't count as a direction and are skipped.
        uint32_t countSignChanges() const;
        bool isJuddering() const;
    };
};
