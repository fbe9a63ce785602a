//
// AC3D
//

#pragma once

#include "common/ac3d_math.h"

namespace AC3D {
    struct ConvergenceConfiguration;

    struct FrameSample {
        // 0 when nothing is close enough to be clipped by the popout, 1 when the nearest geometry sits at or in front of the near limit.
        float intrusion = 0.0f;

        // Linear depth of the nearest relevant geometry. Infinite when the frame has none.
        float nearestDepth = INFINITY;

        static FrameSample fromIntrusion(float intrusion);
    };

    // Turns the depth reported by the host for the nearest relevant geometry into a frame sample.
    struct DepthSignal {
        float nearDepth = 1.0f;
        float farDepth = 10.0f;

        DepthSignal();
        DepthSignal(const ConvergenceConfiguration &cfg);
        void setup(float nearDepth, float farDepth);
        FrameSample fromLinearDepth(float depth) const;

        // For hosts that sample the depth buffer directly. The projection must be the one the scene was rendered with.
        FrameSample fromDeviceDepth(const hlslpp::float4x4 &projection, float deviceDepth) const;

        // Same as above for hosts that only expose the model-view and model-view-projection matrices.
        FrameSample fromDeviceDepth(const hlslpp::float4x4 &modelView, const hlslpp::float4x4 &modelViewProjection, float deviceDepth) const;
    };
};
