//
// AC3D
//

#include "ac3d_math.h"

#include <algorithm>
#include <cmath>

namespace AC3D {
    static const float Pi = 3.14159265358979323846f;

    float toRadians(float degrees) {
        return degrees * (Pi / 180.0f);
    }

    float toDegrees(float radians) {
        return radians * (180.0f / Pi);
    }

    bool matrixIsFinite(const hlslpp::float4x4 &m) {
        for (uint32_t i = 0; i < 4; i++) {
            for (uint32_t j = 0; j < 4; j++) {
                if (!std::isfinite(m[i][j])) {
                    return false;
                }
            }
        }

        return true;
    }

    float matrixDifference(const hlslpp::float4x4 &a, const hlslpp::float4x4 &b) {
        float difference = 0.0f;
        for (uint32_t i = 0; i < 4; i++) {
            for (uint32_t j = 0; j < 4; j++) {
                difference += std::abs(a[i][j] - b[i][j]);
            }
        }

        return difference;
    }

    hlslpp::float4x4 projectionMatrix(float nearPlane, float farPlane, float fovHorizontal, float fovVertical) {
        const float w = 1.0f / std::tan(toRadians(fovHorizontal) / 2.0f);
        const float h = 1.0f / std::tan(toRadians(fovVertical) / 2.0f);
        const float q = farPlane / (farPlane - nearPlane);
        return hlslpp::float4x4(
            w, 0.0f, 0.0f, 0.0f,
            0.0f, h, 0.0f, 0.0f,
            0.0f, 0.0f, q, 1.0f,
            0.0f, 0.0f, -q * nearPlane, 0.0f);
    }

    StereoProjectionPair stereoProjectionPair(float nearPlane, float farPlane, float fovHorizontal, float fovVertical, float separation, float convergence) {
        StereoProjectionPair pair;
        pair.left = projectionMatrix(nearPlane, farPlane, fovHorizontal, fovVertical);
        pair.right = pair.left;
        pair.left[2][0] = -separation;
        pair.left[3][0] = separation * convergence;
        pair.right[2][0] = separation;
        pair.right[3][0] = -separation * convergence;
        return pair;
    }

    hlslpp::float4x4 stereoCorrectionMultiplier(float nearPlane, float farPlane, float separation, float convergence) {
        const float q = farPlane / (farPlane - nearPlane);
        hlslpp::float4x4 m(
            1.0f, 0.0f, 0.0f, 0.0f,
            0.0f, 1.0f, 0.0f, 0.0f,
            0.0f, 0.0f, 1.0f, 0.0f,
            0.0f, 0.0f, 0.0f, 1.0f);

        m[2][0] = (separation * convergence) / (q * nearPlane);
        m[3][0] = separation - (separation * convergence) / nearPlane;
        return m;
    }

    hlslpp::float4x4 stereoCorrectionMultiplierInverse(float nearPlane, float farPlane, float separation, float convergence) {
        // The inverse only negates the two correction terms.
        hlslpp::float4x4 m = stereoCorrectionMultiplier(nearPlane, farPlane, separation, convergence);
        m[2][0] = -m[2][0];
        m[3][0] = -m[3][0];
        return m;
    }

    static float planeFromProj(const hlslpp::float4x4 &m, float deviceDepth) {
        const hlslpp::float4x4 inverse = hlslpp::inverse(m);
        hlslpp::float4 origin = hlslpp::mul(hlslpp::float4(0.0f, 0.0f, deviceDepth, 1.0f), inverse);
        const float originW = origin[3];
        origin = origin / hlslpp::float4(originW);
        const hlslpp::float4 projected = hlslpp::mul(origin, m);
        return projected[3];
    }

    float nearPlaneFromProj(const hlslpp::float4x4 &m) {
        return planeFromProj(m, 0.0f);
    }

    float farPlaneFromProj(const hlslpp::float4x4 &m) {
        return planeFromProj(m, 1.0f);
    }

    float horizontalFovFromProj(const hlslpp::float4x4 &m) {
        return toDegrees(2.0f * std::atan(1.0f / m[0][0]));
    }

    float verticalFovFromProj(const hlslpp::float4x4 &m) {
        return toDegrees(2.0f * std::atan(1.0f / m[1][1]));
    }

    static float determinantEuclidean(const hlslpp::float4x4 &m) {
        return m[0][0] * (m[1][1] * m[2][2] - m[1][2] * m[2][1])
            + m[0][1] * (m[1][2] * m[2][0] - m[1][0] * m[2][2])
            + m[0][2] * (m[1][0] * m[2][1] - m[1][1] * m[2][0]);
    }

    hlslpp::float4x4 inverseEuclidean(const hlslpp::float4x4 &m) {
        hlslpp::float4x4 n(
            0.0f, 0.0f, 0.0f, 0.0f,
            0.0f, 0.0f, 0.0f, 0.0f,
            0.0f, 0.0f, 0.0f, 0.0f,
            0.0f, 0.0f, 0.0f, 0.0f);

        n[0][0] = m[1][1] * m[2][2] - m[1][2] * m[2][1];
        n[1][0] = m[1][2] * m[2][0] - m[1][0] * m[2][2];
        n[2][0] = m[1][0] * m[2][1] - m[1][1] * m[2][0];

        n[0][1] = m[0][2] * m[2][1] - m[0][1] * m[2][2];
        n[1][1] = m[0][0] * m[2][2] - m[0][2] * m[2][0];
        n[2][1] = m[0][1] * m[2][0] - m[0][0] * m[2][1];

        n[0][2] = m[0][1] * m[1][2] - m[0][2] * m[1][1];
        n[1][2] = m[0][2] * m[1][0] - m[0][0] * m[1][2];
        n[2][2] = m[0][0] * m[1][1] - m[0][1] * m[1][0];

        for (int i = 0; i < 3; i++) {
            n[3][i] = -(m[3][0] * n[0][i] + m[3][1] * n[1][i] + m[3][2] * n[2][i]);
        }

        const float determinant = determinantEuclidean(m);
        n[3][3] = determinant;
        for (int i = 0; i < 4; i++) {
            for (int j = 0; j < 4; j++) {
                n[i][j] = n[i][j] / determinant;
            }
        }

        return n;
    }

    hlslpp::float4x4 projectionFromModelViewPair(const hlslpp::float4x4 &modelView, const hlslpp::float4x4 &modelViewProjection) {
        return hlslpp::mul(inverseEuclidean(modelView), modelViewProjection);
    }

    float inverseProjectionScaleFromModelViewPair(const hlslpp::float4x4 &modelView, const hlslpp::float4x4 &modelViewProjection) {
        const float determinant = determinantEuclidean(modelView);
        const float row0 = (modelView[1][1] * modelView[2][2] - modelView[1][2] * modelView[2][1]) / determinant;
        const float row1 = (modelView[0][2] * modelView[2][1] - modelView[0][1] * modelView[2][2]) / determinant;
        const float row2 = (modelView[0][1] * modelView[1][2] - modelView[0][2] * modelView[1][1]) / determinant;
        const float projection00 = row0 * modelViewProjection[0][0] + row1 * modelViewProjection[1][0] + row2 * modelViewProjection[2][0];
        return 1.0f / projection00;
    }

    float linearDepthFromProj(const hlslpp::float4x4 &m, float deviceDepth) {
        const float divisor = deviceDepth - m[2][2];
        if (divisor == 0.0f) {
            return INFINITY;
        }

        return m[3][2] / divisor;
    }

    float stereoAdjustment(float w, float separation, float convergence) {
        return separation * (w - convergence);
    }

    StereoCoordinatePair stereoCorrect(const hlslpp::float4 &coord, float separation, float convergence) {
        const float a = stereoAdjustment(coord[3], separation, convergence);
        StereoCoordinatePair pair;
        pair.left = coord;
        pair.right = coord;
        pair.left[0] = coord[0] - a;
        pair.right[0] = coord[0] + a;
        return pair;
    }

    float popoutAtDepth(float depth, float convergence) {
        return convergence / depth - 1.0f;
    }

    float convergenceForPopout(float depth, float popout) {
        return depth * (1.0f + popout);
    }
};
