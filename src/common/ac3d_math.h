//
// AC3D
//

#pragma once

#include <cmath>

#include "ac3d_common.h"

// Matrices follow the row-vector convention used by D3D shaders: clip = mul(view, projection).

namespace AC3D {
    struct StereoProjectionPair {
        hlslpp::float4x4 left;
        hlslpp::float4x4 right;
    };

    struct StereoCoordinatePair {
        hlslpp::float4 left;
        hlslpp::float4 right;
    };

    float toRadians(float degrees);
    float toDegrees(float radians);
    bool matrixIsFinite(const hlslpp::float4x4 &m);
    float matrixDifference(const hlslpp::float4x4 &a, const hlslpp::float4x4 &b);

    hlslpp::float4x4 projectionMatrix(float nearPlane, float farPlane, float fovHorizontal, float fovVertical);

    // Left and right eye projections equivalent to the driver's built-in stereo correction, so the usual
    // separation and convergence settings behave identically when the correction is baked into the matrix.
    StereoProjectionPair stereoProjectionPair(float nearPlane, float farPlane, float fovHorizontal, float fovVertical, float separation, float convergence);

    // Multiplier that adds the stereo correction to a projection matrix or to a composite view-projection
    // matrix. Use a negative separation for the left eye.
    hlslpp::float4x4 stereoCorrectionMultiplier(float nearPlane, float farPlane, float separation, float convergence);

    // Removes the correction above from an inverted matrix.
    hlslpp::float4x4 stereoCorrectionMultiplierInverse(float nearPlane, float farPlane, float separation, float convergence);

    // Works on plain projections as well as composite matrices that contain one.
    float nearPlaneFromProj(const hlslpp::float4x4 &m);
    float farPlaneFromProj(const hlslpp::float4x4 &m);
    float horizontalFovFromProj(const hlslpp::float4x4 &m);
    float verticalFovFromProj(const hlslpp::float4x4 &m);

    // Inverse of a rigid or affine transform whose last column is (0, 0, 0, 1), such as a model-view matrix.
    // The result is not finite when the matrix is singular.
    hlslpp::float4x4 inverseEuclidean(const hlslpp::float4x4 &m);

    // Recovers the projection from a model-view and model-view-projection pair. Many engines only hand out
    // these two, so the projection is never available on its own.
    hlslpp::float4x4 projectionFromModelViewPair(const hlslpp::float4x4 &modelView, const hlslpp::float4x4 &modelViewProjection);

    // Top left cell of the inverse projection, tan(fovHorizontal / 2). Only needs the first row of the inverse
    // model-view and the first column of the model-view-projection.
    float inverseProjectionScaleFromModelViewPair(const hlslpp::float4x4 &modelView, const hlslpp::float4x4 &modelViewProjection);

    // Linear (view space) depth from a device depth value of a plain projection matrix.
    float linearDepthFromProj(const hlslpp::float4x4 &m, float deviceDepth);

    float stereoAdjustment(float w, float separation, float convergence);
    StereoCoordinatePair stereoCorrect(const hlslpp::float4 &coord, float separation, float convergence);

    // Popout is the on-screen parallax of an object expressed as a fraction of the separation, positive
    // when the object appears in front of the screen.
    float popoutAtDepth(float depth, float convergence);
    float convergenceForPopout(float depth, float popout);
};
