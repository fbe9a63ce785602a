//
// AC3D
//

#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <string>

#include "common/ac3d_frame_timer.h"
#include "control/ac3d_convergence_controller.h"
#include "input/ac3d_input.h"

namespace AC3D {
    // Receives the popout chosen for the frame together with the convergence distance that produces it.
    struct StereoOutput {
        virtual void applyPopout(float popout, float convergence) = 0;
    };

    // Shows the popout on screen after the user changes it.
    struct PopoutDisplay {
        virtual void showPopout(float popout) = 0;
    };

    struct HostSession : ConvergenceController::Listener {
        ConvergenceConfiguration configuration;
        BindingConfiguration bindings;
        DepthSignal depthSignal;
        std::unique_ptr<ConvergenceController> controller;
        InputDispatcher input;
        FrameTimer frameTimer;
        StereoOutput *output = nullptr;
        PopoutDisplay *display = nullptr;

        // Used instead of the controller when the configuration could not be used.
        float staticPopout = 0.0f;

        std::string configurationError;

        HostSession(StereoOutput *output = nullptr, PopoutDisplay *display = nullptr);
        ~HostSession();

        // A missing file runs with the defaults. Returns whether auto-convergence is available.
        bool initialize(const std::filesystem::path &configurationPath);
        bool initialize(std::istream &stream);
        bool setup(const ConvergenceConfiguration &configuration, const BindingConfiguration &bindings);
        void shutdown();

        // Runs the input bindings and the controller for one frame and forwards the result to the output.
        float frame(const FrameSample &sample, float deltaTime);

        // Same as above but measures the frame time with the session's timer.
        float frame(const FrameSample &sample);

        bool processEvent(const SDL_Event &event);
        void toggleEnabled();
        void adjustManual(Direction direction);
        bool isAutoConvergenceAvailable() const;
        bool isLockedLow() const;
        float getPopout() const;
        void popoutAdjusted(float popout) override;

    private:
        void fallback(const std::string &error);
        void registerBindings();
    };
};
