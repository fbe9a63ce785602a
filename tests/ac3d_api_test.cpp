//
// AC3D
//

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "SDL.h"

#include "ac3d_plugin.h"
#include "common/ac3d_math.h"

namespace {
    struct CallbackRecorder {
        std::vector<float> popouts;
        std::vector<float> convergences;
        std::vector<float> shown;
    };

    void recordApply(float popout, float convergence, void *userData) {
        CallbackRecorder *recorder = static_cast<CallbackRecorder *>(userData);
        recorder->popouts.push_back(popout);
        recorder->convergences.push_back(convergence);
    }

    void recordShow(float popout, void *userData) {
        static_cast<CallbackRecorder *>(userData)->shown.push_back(popout);
    }

    struct PluginTest : testing::Test {
        CallbackRecorder recorder;

        void TearDown() override {
            AC3D_Shutdown();
        }
    };
}

TEST_F(PluginTest, InitializeWithoutPathUsesDefaults) {
    ASSERT_EQ(AC3D_Initialize(nullptr, recordApply, recordShow, &recorder), 1);
    EXPECT_STREQ(AC3D_GetLastError(), "");

    EXPECT_FLOAT_EQ(AC3D_UpdateFrame(20.0f, 0.0f), 0.3f);
    ASSERT_EQ(recorder.popouts.size(), 1U);
    EXPECT_FLOAT_EQ(recorder.popouts[0], 0.3f);
    EXPECT_FLOAT_EQ(recorder.convergences[0], 20.0f * 1.3f);
    EXPECT_EQ(AC3D_IsLockedLow(), 0);
    EXPECT_FLOAT_EQ(AC3D_GetPopout(), 0.3f);
}

TEST_F(PluginTest, CallsWithoutSessionAreIgnored) {
    ASSERT_EQ(AC3D_Initialize(nullptr, recordApply, recordShow, &recorder), 1);
    AC3D_Shutdown();

    EXPECT_FLOAT_EQ(AC3D_UpdateFrame(20.0f, 0.1f), 0.0f);
    EXPECT_FLOAT_EQ(AC3D_UpdateFrameDeviceDepth(nullptr, 0.5f, 0.1f), 0.0f);
    AC3D_ToggleEnabled();
    AC3D_AdjustPopout(AC3D_DIRECTION_INCREASE);
    EXPECT_EQ(AC3D_ProcessKeyEvent(SDLK_F5, AC3D_MODIFIER_NONE, 1), 0);
    EXPECT_FLOAT_EQ(AC3D_GetPopout(), 0.0f);
    EXPECT_EQ(AC3D_IsLockedLow(), 0);
    EXPECT_TRUE(recorder.popouts.empty());
    EXPECT_TRUE(recorder.shown.empty());
}

TEST_F(PluginTest, NegativeDeltaMeasuresFrameTime) {
    ASSERT_EQ(AC3D_Initialize(nullptr, recordApply, recordShow, &recorder), 1);

    // The first measured frame has no previous frame to compare against.
    EXPECT_FLOAT_EQ(AC3D_UpdateFrame(20.0f, -1.0f), 0.3f);

    // Later frames rise by at most the clamped frame step.
    const float popout = AC3D_UpdateFrame(20.0f, -1.0f);
    EXPECT_GE(popout, 0.3f);
    EXPECT_LE(popout, 0.3f + 0.25f * 0.25f + 1e-6f);
}

TEST_F(PluginTest, DeviceDepthUsesProjection) {
    ASSERT_EQ(AC3D_Initialize(nullptr, recordApply, recordShow, &recorder), 1);

    const hlslpp::float4x4 projection = AC3D::projectionMatrix(1.0f, 100.0f, 90.0f, 90.0f);
    float values[16];
    for (int row = 0; row < 4; row++) {
        for (int column = 0; column < 4; column++) {
            values[row * 4 + column] = projection[row][column];
        }
    }

    const hlslpp::float4 clip = hlslpp::mul(hlslpp::float4(0.0f, 0.0f, 20.0f, 1.0f), projection);
    EXPECT_FLOAT_EQ(AC3D_UpdateFrameDeviceDepth(values, clip[2] / clip[3], 0.0f), 0.3f);
    ASSERT_EQ(recorder.convergences.size(), 1U);
    EXPECT_NEAR(recorder.convergences[0], 20.0f * 1.3f, 1e-2f);

    // Without a projection the frame counts as empty and the far occlusion depth is the reference.
    EXPECT_FLOAT_EQ(AC3D_UpdateFrameDeviceDepth(nullptr, 0.5f, 0.0f), 0.3f);
    ASSERT_EQ(recorder.convergences.size(), 2U);
    EXPECT_FLOAT_EQ(recorder.convergences[1], 10.0f * 1.3f);
}

TEST_F(PluginTest, ModelViewDepthRecoversProjection) {
    ASSERT_EQ(AC3D_Initialize(nullptr, recordApply, recordShow, &recorder), 1);

    const hlslpp::float4x4 projection = AC3D::projectionMatrix(1.0f, 100.0f, 90.0f, 90.0f);
    const hlslpp::float4x4 modelView(
        1.0f, 0.0f, 0.0f, 0.0f,
        0.0f, 1.0f, 0.0f, 0.0f,
        0.0f, 0.0f, 1.0f, 0.0f,
        0.0f, 5.0f, 2.0f, 1.0f);

    const hlslpp::float4x4 modelViewProjection = hlslpp::mul(modelView, projection);
    float modelViewValues[16];
    float modelViewProjectionValues[16];
    for (int row = 0; row < 4; row++) {
        for (int column = 0; column < 4; column++) {
            modelViewValues[row * 4 + column] = modelView[row][column];
            modelViewProjectionValues[row * 4 + column] = modelViewProjection[row][column];
        }
    }

    const hlslpp::float4 clip = hlslpp::mul(hlslpp::float4(0.0f, 0.0f, 20.0f, 1.0f), projection);
    EXPECT_FLOAT_EQ(AC3D_UpdateFrameModelViewDepth(modelViewValues, modelViewProjectionValues, clip[2] / clip[3], 0.0f), 0.3f);
    ASSERT_EQ(recorder.convergences.size(), 1U);
    EXPECT_NEAR(recorder.convergences[0], 20.0f * 1.3f, 1e-2f);

    EXPECT_FLOAT_EQ(AC3D_UpdateFrameModelViewDepth(modelViewValues, nullptr, 0.5f, 0.0f), 0.3f);
    ASSERT_EQ(recorder.convergences.size(), 2U);
    EXPECT_FLOAT_EQ(recorder.convergences[1], 10.0f * 1.3f);
}

TEST_F(PluginTest, AdjustPopoutReachesDisplayCallback) {
    ASSERT_EQ(AC3D_Initialize(nullptr, recordApply, recordShow, &recorder), 1);
    AC3D_AdjustPopout(AC3D_DIRECTION_DECREASE);
    ASSERT_EQ(recorder.shown.size(), 1U);
    EXPECT_FLOAT_EQ(recorder.shown[0], 0.25f);

    EXPECT_FLOAT_EQ(AC3D_UpdateFrame(20.0f, 1.0f), 0.25f);
    EXPECT_FLOAT_EQ(AC3D_GetPopout(), 0.25f);
}

TEST_F(PluginTest, ToggleKeyEventStopsTracking) {
    ASSERT_EQ(AC3D_Initialize(nullptr, recordApply, recordShow, &recorder), 1);
    EXPECT_EQ(AC3D_ProcessKeyEvent(SDLK_F5, AC3D_MODIFIER_NONE, 1), 1);
    EXPECT_FLOAT_EQ(AC3D_UpdateFrame(20.0f, 0.1f), 0.3f);
    EXPECT_FLOAT_EQ(AC3D_UpdateFrame(20.0f, 0.1f), 0.3f);

    EXPECT_EQ(AC3D_ProcessKeyEvent(SDLK_F5, AC3D_MODIFIER_NONE, 0), 1);
    AC3D_UpdateFrame(20.0f, 0.0f);
    AC3D_ToggleEnabled();
    EXPECT_GT(AC3D_UpdateFrame(20.0f, 0.1f), 0.3f);
}

TEST_F(PluginTest, InvalidConfigurationReportsError) {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "ac3d_plugin_test_invalid.json";
    {
        std::ofstream stream(path);
        ASSERT_TRUE(stream.is_open());
        stream << R"({ "configuration": { "minConvergence": 0.9, "maxConvergence": 0.1 } })";
    }

    const std::string u8string = path.u8string();
    EXPECT_EQ(AC3D_Initialize(u8string.c_str(), recordApply, recordShow, &recorder), 0);
    EXPECT_NE(std::string(AC3D_GetLastError()).find("minConvergence"), std::string::npos);

    // The static popout is still served and adjusted.
    EXPECT_FLOAT_EQ(AC3D_UpdateFrame(1.0f, 0.5f), 0.3f);
    AC3D_AdjustPopout(AC3D_DIRECTION_INCREASE);
    ASSERT_EQ(recorder.shown.size(), 1U);
    EXPECT_FLOAT_EQ(recorder.shown[0], 0.35f);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}
