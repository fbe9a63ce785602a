//
// AC3D
//

#include "ac3d_judder_detector.h"

namespace AC3D {
    // JudderDetector

    JudderDetector::JudderDetector() { }

    JudderDetector::JudderDetector(uint32_t windowSize, uint32_t signChangeThreshold) {
        setup(windowSize, signChangeThreshold);
    }

    void JudderDetector::setup(uint32_t windowSize, uint32_t signChangeThreshold) {
        this->windowSize = windowSize;
        this->signChangeThreshold = signChangeThreshold;
        reset();
    }

    void JudderDetector::reset() {
        history.clear();
    }

    bool JudderDetector::push(float popout) {
        if (windowSize == 0) {
            return false;
        }

        while (history.size() >= windowSize) {
            history.pop_front();
        }

        history.push_back(popout);
        return isJuddering();
    }

    uint32_t JudderDetector::countSignChanges() const {
        uint32_t signChanges = 0;
        int lastSign = 0;
        for (size_t i = 1; i < history.size(); i++) {
            const float difference = history[i] - history[i - 1];
            int sign = (difference > 0.0f) ? 1 : ((difference < 0.0f) ? -1 : 0);
            if (sign == 0) {
                continue;
            }

            if ((lastSign != 0) && (sign != lastSign)) {
                signChanges++;
            }

            lastSign = sign;
        }

        return signChanges;
    }

    bool JudderDetector::isJuddering() const {
        return countSignChanges() > signChangeThreshold;
    }
};
