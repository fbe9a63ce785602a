//
// AC3D
//

#include "ac3d_depth_signal.h"

#include <algorithm>
#include <cmath>

#include "common/ac3d_convergence_configuration.h"

namespace AC3D {
    // FrameSample

    FrameSample FrameSample::fromIntrusion(float intrusion) {
        FrameSample sample;
        sample.intrusion = std::isfinite(intrusion) ? std::clamp(intrusion, 0.0f, 1.0f) : 0.0f;
        return sample;
    }

    // DepthSignal

    DepthSignal::DepthSignal() { }

    DepthSignal::DepthSignal(const ConvergenceConfiguration &cfg) {
        setup(cfg.occlusionNearDepth, cfg.occlusionFarDepth);
    }

    void DepthSignal::setup(float nearDepth, float farDepth) {
        this->nearDepth = nearDepth;
        this->farDepth = farDepth;
    }

    FrameSample DepthSignal::fromLinearDepth(float depth) const {
        FrameSample sample;

        // Depth buffers that were cleared or skies at infinity report nothing to avoid.
        if (std::isnan(depth) || (depth <= 0.0f)) {
            return sample;
        }

        sample.nearestDepth = depth;
        if (!std::isfinite(depth) || (depth >= farDepth)) {
            sample.intrusion = 0.0f;
        }
        else if (depth <= nearDepth) {
            sample.intrusion = 1.0f;
        }
        else {
            sample.intrusion = (farDepth - depth) / (farDepth - nearDepth);
        }

        return sample;
    }

    FrameSample DepthSignal::fromDeviceDepth(const hlslpp::float4x4 &projection, float deviceDepth) const {
        if (!matrixIsFinite(projection) || !std::isfinite(deviceDepth)) {
            return FrameSample();
        }

        return fromLinearDepth(linearDepthFromProj(projection, std::clamp(deviceDepth, 0.0f, 1.0f)));
    }

    FrameSample DepthSignal::fromDeviceDepth(const hlslpp::float4x4 &modelView, const hlslpp::float4x4 &modelViewProjection, float deviceDepth) const {
        if (!matrixIsFinite(modelView) || !matrixIsFinite(modelViewProjection)) {
            return FrameSample();
        }

        return fromDeviceDepth(projectionFromModelViewPair(modelView, modelViewProjection), deviceDepth);
    }
};
