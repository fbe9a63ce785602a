//
// AC3D
//

#include "ac3d_host_session.h"

#include <algorithm>
#include <cmath>
#include <fstream>

#include "common/ac3d_math.h"

namespace AC3D {
    // HostSession

    HostSession::HostSession(StereoOutput *output, PopoutDisplay *display) {
        this->output = output;
        this->display = display;
        staticPopout = configuration.initialPopout;
    }

    HostSession::~HostSession() {
        shutdown();
    }

    bool HostSession::initialize(const std::filesystem::path &configurationPath) {
        if (!std::filesystem::exists(configurationPath)) {
            std::string u8string = configurationPath.u8string();
            fprintf(stderr, "Configuration file %s was not found. Using the default configuration.\n", u8string.c_str());
            return setup(ConvergenceConfiguration(), BindingConfiguration());
        }

        std::ifstream stream(configurationPath);
        if (!stream.is_open()) {
            std::string u8string = configurationPath.u8string();
            fallback("Failed to open configuration file at " + u8string + ".");
            return false;
        }

        return initialize(stream);
    }

    bool HostSession::initialize(std::istream &stream) {
        ConvergenceConfiguration newConfiguration;
        BindingConfiguration newBindings;
        if (!ConfigurationJSON::read(newConfiguration, newBindings, stream)) {
            bindings = newBindings;
            fallback("Failed to read the configuration.");
            return false;
        }

        return setup(newConfiguration, newBindings);
    }

    bool HostSession::setup(const ConvergenceConfiguration &configuration, const BindingConfiguration &bindings) {
        shutdown();

        this->bindings = bindings;
        this->bindings.validate();

        std::string error;
        if (!configuration.validate(error)) {
            fallback(error);
            return false;
        }

        this->configuration = configuration;
        configurationError.clear();
        depthSignal = DepthSignal(configuration);
        controller = std::make_unique<ConvergenceController>(configuration, this);
        staticPopout = controller->getCurrentPopout();
        registerBindings();

        AC3D_LOG_PRINTF("Auto-convergence initialized with popout %f in [%f, %f].", configuration.initialPopout, configuration.minConvergence, configuration.maxConvergence);
        return true;
    }

    void HostSession::shutdown() {
        input.clearActions();
        controller.reset();
        frameTimer.reset();
    }

    float HostSession::frame(const FrameSample &sample, float deltaTime) {
        input.dispatch(deltaTime);

        float popout = staticPopout;
        if (controller != nullptr) {
            popout = controller->update(sample, deltaTime);
        }

        if (output != nullptr) {
            const float referenceDepth = std::isfinite(sample.nearestDepth) ? sample.nearestDepth : configuration.occlusionFarDepth;
            output->applyPopout(popout, convergenceForPopout(referenceDepth, popout));
        }

        return popout;
    }

    float HostSession::frame(const FrameSample &sample) {
        return frame(sample, float(frameTimer.tick()));
    }

    bool HostSession::processEvent(const SDL_Event &event) {
        return input.processEvent(event);
    }

    void HostSession::toggleEnabled() {
        if (controller == nullptr) {
            fprintf(stderr, "Auto-convergence is unavailable: %s\n", configurationError.c_str());
            return;
        }

        controller->toggleEnabled();
    }

    void HostSession::adjustManual(Direction direction) {
        if (controller != nullptr) {
            controller->adjustManual(direction);
            return;
        }

        // Without the controller the keys drive the static popout directly.
        const float step = (direction == Direction::Increase) ? configuration.manualStepSize : -configuration.manualStepSize;
        staticPopout = std::clamp(staticPopout + step, configuration.minConvergence, configuration.maxConvergence);
        popoutAdjusted(staticPopout);
    }

    bool HostSession::isAutoConvergenceAvailable() const {
        return (controller != nullptr);
    }

    bool HostSession::isLockedLow() const {
        return (controller != nullptr) && controller->isLockedLow();
    }

    float HostSession::getPopout() const {
        return (controller != nullptr) ? controller->getCurrentPopout() : staticPopout;
    }

    void HostSession::popoutAdjusted(float popout) {
        if (display != nullptr) {
            display->showPopout(popout);
        }
    }

    void HostSession::fallback(const std::string &error) {
        shutdown();
        configurationError = error;
        GlobalLastError = error;
        fprintf(stderr, "Invalid auto-convergence configuration: %s Falling back to static convergence.\n", error.c_str());
        AC3D_LOG_PRINTF("Auto-convergence disabled: %s", error.c_str());

        controller.reset();
        configuration = ConvergenceConfiguration();
        depthSignal = DepthSignal(configuration);
        staticPopout = configuration.initialPopout;
        registerBindings();
    }

    void HostSession::registerBindings() {
        input.clearActions();

        bool registered = input.registerAction(bindings.toggleKey, [this]() { toggleEnabled(); });
        registered = input.registerAction(bindings.increaseKey, [this]() { adjustManual(Direction::Increase); }, bindings.repeatRate) && registered;
        registered = input.registerAction(bindings.decreaseKey, [this]() { adjustManual(Direction::Decrease); }, bindings.repeatRate) && registered;
        if (!registered) {
            fprintf(stderr, "Some auto-convergence key bindings are invalid and will be ignored.\n");
        }
    }
};
