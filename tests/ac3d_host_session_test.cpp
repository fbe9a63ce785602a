//
// AC3D
//

#include <sstream>
#include <vector>

#include <gtest/gtest.h>

#include "common/ac3d_common.h"
#include "host/ac3d_host_session.h"

namespace {
    struct RecordingOutput : AC3D::StereoOutput, AC3D::PopoutDisplay {
        std::vector<float> popouts;
        std::vector<float> convergences;
        std::vector<float> shown;

        void applyPopout(float popout, float convergence) override {
            popouts.push_back(popout);
            convergences.push_back(convergence);
        }

        void showPopout(float popout) override {
            shown.push_back(popout);
        }
    };
}

TEST(HostSessionTest, ForwardsConvergenceForPopout) {
    RecordingOutput recorder;
    AC3D::HostSession session(&recorder, &recorder);
    ASSERT_TRUE(session.setup(AC3D::ConvergenceConfiguration(), AC3D::BindingConfiguration()));
    ASSERT_TRUE(session.isAutoConvergenceAvailable());

    const AC3D::FrameSample sample = session.depthSignal.fromLinearDepth(20.0f);
    EXPECT_FLOAT_EQ(session.frame(sample, 0.0f), 0.3f);
    ASSERT_EQ(recorder.popouts.size(), 1U);
    EXPECT_FLOAT_EQ(recorder.popouts[0], 0.3f);
    EXPECT_FLOAT_EQ(recorder.convergences[0], 20.0f * 1.3f);
}

TEST(HostSessionTest, InvalidConfigurationFallsBackToStaticPopout) {
    RecordingOutput recorder;
    AC3D::HostSession session(&recorder, &recorder);
    AC3D::ConvergenceConfiguration cfg;
    cfg.minConvergence = 0.8f;
    cfg.maxConvergence = 0.2f;
    AC3D::GlobalLastError.clear();
    EXPECT_FALSE(session.setup(cfg, AC3D::BindingConfiguration()));
    EXPECT_FALSE(session.isAutoConvergenceAvailable());
    EXPECT_FALSE(session.configurationError.empty());
    EXPECT_EQ(AC3D::GlobalLastError, session.configurationError);

    const AC3D::FrameSample sample = session.depthSignal.fromLinearDepth(1.0f);
    EXPECT_FLOAT_EQ(session.frame(sample, 0.5f), 0.3f);

    // The manual keys keep working on the static popout.
    session.adjustManual(AC3D::Direction::Increase);
    EXPECT_FLOAT_EQ(session.getPopout(), 0.35f);
    ASSERT_EQ(recorder.shown.size(), 1U);
    EXPECT_FLOAT_EQ(recorder.shown[0], 0.35f);

    session.toggleEnabled();
    EXPECT_FALSE(session.isAutoConvergenceAvailable());
    EXPECT_FALSE(session.isLockedLow());
}

TEST(HostSessionTest, MalformedConfigurationFallsBack) {
    AC3D::HostSession session;
    std::istringstream stream("{ \"configuration\": [ ");
    EXPECT_FALSE(session.initialize(stream));
    EXPECT_FALSE(session.isAutoConvergenceAvailable());
    EXPECT_FLOAT_EQ(session.getPopout(), 0.3f);
}

TEST(HostSessionTest, LoadsConfigurationFromStream) {
    AC3D::HostSession session;
    std::istringstream stream("{ \"configuration\": { \"initialPopout\": 0.5, \"judderThreshold\": 4 } }");
    ASSERT_TRUE(session.initialize(stream));
    EXPECT_FLOAT_EQ(session.getPopout(), 0.5f);
    EXPECT_EQ(session.configuration.judderThreshold, 4);
}

TEST(HostSessionTest, MissingConfigurationFileUsesDefaults) {
    AC3D::HostSession session;
    EXPECT_TRUE(session.initialize(std::filesystem::path("ac3d_missing_configuration.json")));
    EXPECT_TRUE(session.isAutoConvergenceAvailable());
    EXPECT_FLOAT_EQ(session.getPopout(), 0.3f);
}

TEST(HostSessionTest, ToggleKeyDisablesController) {
    AC3D::HostSession session;
    ASSERT_TRUE(session.setup(AC3D::ConvergenceConfiguration(), AC3D::BindingConfiguration()));
    ASSERT_TRUE(session.controller->isEnabled());

    SDL_Event event = {};
    event.type = SDL_KEYDOWN;
    event.key.state = SDL_PRESSED;
    event.key.keysym.sym = SDLK_F5;
    event.key.keysym.mod = KMOD_NONE;
    EXPECT_TRUE(session.processEvent(event));

    const float popout = session.frame(session.depthSignal.fromLinearDepth(20.0f), 1.0f / 60.0f);
    EXPECT_FALSE(session.controller->isEnabled());
    EXPECT_FLOAT_EQ(popout, 0.3f);
}

TEST(FrameTimerTest, FirstTickIsZeroAndStallsAreClamped) {
    AC3D::FrameTimer timer;
    const AC3D::Timestamp start = AC3D::Timer::current();
    EXPECT_DOUBLE_EQ(timer.tick(start), 0.0);
    EXPECT_NEAR(timer.tick(start + std::chrono::milliseconds(10)), 0.01, 1e-9);
    EXPECT_DOUBLE_EQ(timer.tick(start + std::chrono::seconds(5)), AC3D::FrameTimer::MaxDeltaSeconds);

    timer.reset();
    EXPECT_DOUBLE_EQ(timer.tick(start + std::chrono::seconds(6)), 0.0);
}
