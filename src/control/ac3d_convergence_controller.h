//
// AC3D
//

#pragma once

#include "common/ac3d_common.h"
#include "common/ac3d_convergence_configuration.h"

#include "ac3d_depth_signal.h"
#include "ac3d_judder_detector.h"

namespace AC3D {
    struct ConvergenceController {
        enum class State {
            Tracking,
            LockedLow
        };

        struct Listener {
            // Called with the popout requested by a manual adjustment so it can be shown on screen.
            virtual void popoutAdjusted(float popout) = 0;
        };

        ConvergenceConfiguration configuration;
        JudderDetector judderDetector;
        Listener *listener = nullptr;
        State state = State::Tracking;
        bool enabled = true;
        float currentPopout = 0.0f;
        float targetPopout = 0.0f;

        // Upper limit requested by the user through manual adjustments. The depth signal can only lower the target below it.
        float preferredPopout = 0.0f;

        // Occlusion limit from the most recent frame sample.
        float occlusionCeiling = 0.0f;

        float lockTimer = 0.0f;

        // The configuration must have passed validation.
        ConvergenceController(const ConvergenceConfiguration &configuration, Listener *listener = nullptr);

        // Advances the controller by one frame and returns the popout the stereo renderer should use.
        // Does nothing and returns the last value while disabled.
        float update(const FrameSample &sample, float deltaTime);

        void toggleEnabled();
        void adjustManual(Direction direction);
        bool isLockedLow() const;
        bool isEnabled() const;
        float getCurrentPopout() const;
        float getTargetPopout() const;

    private:
        float occlusionLimit(float intrusion) const;
        void lockLow();
        void unlock();
        void resetTracking();
    };
};
