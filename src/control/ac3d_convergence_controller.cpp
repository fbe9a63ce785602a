//
// AC3D
//

#include "ac3d_convergence_controller.h"

#include <algorithm>
#include <cmath>

namespace AC3D {
    // ConvergenceController

    ConvergenceController::ConvergenceController(const ConvergenceConfiguration &configuration, Listener *listener) {
        this->configuration = configuration;
        this->listener = listener;

        judderDetector.setup(uint32_t(std::max(configuration.judderDetectionWindow, 0)), uint32_t(std::max(configuration.judderThreshold, 0)));
        enabled = configuration.enabledOnStart;
        currentPopout = std::clamp(configuration.initialPopout, configuration.minConvergence, configuration.maxConvergence);
        resetTracking();
    }

    float ConvergenceController::update(const FrameSample &sample, float deltaTime) {
        if (!enabled) {
            return currentPopout;
        }

        if (!std::isfinite(deltaTime) || (deltaTime < 0.0f)) {
            deltaTime = 0.0f;
        }

        const float minPopout = configuration.minConvergence;
        const float maxPopout = configuration.maxConvergence;
        occlusionCeiling = occlusionLimit(sample.intrusion);
        if (state == State::LockedLow) {
            lockTimer -= deltaTime;
            if (lockTimer > 0.0f) {
                targetPopout = minPopout;
                currentPopout = minPopout;
                return currentPopout;
            }

            unlock();
        }

        // Both limits apply at once: the one that keeps near geometry visible always wins.
        targetPopout = std::clamp(std::min(preferredPopout, occlusionCeiling), minPopout, maxPopout);

        const float deviation = targetPopout - currentPopout;
        if (std::abs(deviation) > configuration.popoutDeviationThreshold) {
            const float rate = (deviation < 0.0f) ? configuration.popoutFallRate : configuration.popoutRiseRate;
            const float maxStep = rate * deltaTime;
            if (std::abs(deviation) <= maxStep) {
                currentPopout = targetPopout;
            }
            else {
                currentPopout += (deviation < 0.0f) ? -maxStep : maxStep;
            }
        }

        currentPopout = std::clamp(currentPopout, minPopout, maxPopout);
        if (judderDetector.push(currentPopout)) {
            lockLow();
        }

        return currentPopout;
    }

    void ConvergenceController::toggleEnabled() {
        enabled = !enabled;
        if (enabled) {
            resetTracking();
        }

        AC3D_LOG_PRINTF("Auto-convergence %s at popout %f.", enabled ? "enabled" : "disabled", currentPopout);
    }

    void ConvergenceController::adjustManual(Direction direction) {
        if (!enabled) {
            return;
        }

        const float minPopout = configuration.minConvergence;
        const float maxPopout = configuration.maxConvergence;
        float newPreferredPopout = preferredPopout;
        if (direction == Direction::Increase) {
            // Pushing the popout out again while locked would restart the oscillation.
            if (state == State::LockedLow) {
                return;
            }

            newPreferredPopout = std::clamp(preferredPopout + configuration.manualStepSize, minPopout, maxPopout);
        }
        else if (state == State::LockedLow) {
            // The popout is already at the floor. Only the preference the lock will return to is lowered.
            newPreferredPopout = std::clamp(preferredPopout - configuration.manualStepSize, minPopout, maxPopout);
        }
        else {
            // Decreases start from what is on screen so they are always visible, even while occlusion holds the target down.
            newPreferredPopout = std::clamp(std::min(preferredPopout, targetPopout) - configuration.manualStepSize, minPopout, maxPopout);
        }

        if (newPreferredPopout == preferredPopout) {
            return;
        }

        preferredPopout = newPreferredPopout;
        if (state == State::Tracking) {
            targetPopout = std::clamp(std::min(preferredPopout, occlusionCeiling), minPopout, maxPopout);
        }

        AC3D_LOG_PRINTF("Manual popout adjustment to %f with target %f.", preferredPopout, targetPopout);

        if (listener != nullptr) {
            listener->popoutAdjusted(preferredPopout);
        }
    }

    bool ConvergenceController::isLockedLow() const {
        return (state == State::LockedLow);
    }

    bool ConvergenceController::isEnabled() const {
        return enabled;
    }

    float ConvergenceController::getCurrentPopout() const {
        return currentPopout;
    }

    float ConvergenceController::getTargetPopout() const {
        return targetPopout;
    }

    float ConvergenceController::occlusionLimit(float intrusion) const {
        if (!std::isfinite(intrusion)) {
            intrusion = 0.0f;
        }

        intrusion = std::clamp(intrusion, 0.0f, 1.0f);
        return configuration.maxConvergence - intrusion * (configuration.maxConvergence - configuration.minConvergence);
    }

    void ConvergenceController::lockLow() {
        state = State::LockedLow;
        lockTimer = configuration.lockDurationSeconds;
        targetPopout = configuration.minConvergence;
        currentPopout = configuration.minConvergence;
        judderDetector.reset();
        AC3D_LOG_PRINTF("Judder detected. Popout locked to %f for %f seconds.", currentPopout, lockTimer);
    }

    void ConvergenceController::unlock() {
        state = State::Tracking;
        lockTimer = 0.0f;
        judderDetector.reset();
        AC3D_LOG_PRINTF("Popout lock released.");
    }

    void ConvergenceController::resetTracking() {
        state = State::Tracking;
        lockTimer = 0.0f;
        targetPopout = currentPopout;
        preferredPopout = configuration.maxConvergence;
        occlusionCeiling = configuration.maxConvergence;
        judderDetector.reset();
    }
};
