//
// AC3D
//

#pragma once

#include <istream>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace AC3D {
    struct ConvergenceConfiguration {
        static const int MinJudderDetectionWindow;

        // Popout the controller starts from.
        float initialPopout;

        // Bounds of the popout the controller emits.
        float minConvergence;
        float maxConvergence;

        // Deviations from the target smaller than this are ignored.
        float popoutDeviationThreshold;

        // Amount of recent popout samples inspected for oscillation.
        int judderDetectionWindow;

        // Oscillation is detected once the direction of the popout changes more times than this within the window.
        int judderThreshold;

        float lockDurationSeconds;
        float manualStepSize;

        // Ramp rates in popout units per second. Pulling towards the viewer is expected to be faster than pushing away.
        float popoutRiseRate;
        float popoutFallRate;

        // Linear depth range over which the nearest geometry goes from full intrusion to no intrusion.
        float occlusionNearDepth;
        float occlusionFarDepth;

        bool enabledOnStart;

        ConvergenceConfiguration();

        // Returns false and fills the error message if the configuration can't be used by the controller.
        bool validate(std::string &error) const;
    };

    struct BindingConfiguration {
        std::string toggleKey;
        std::string increaseKey;
        std::string decreaseKey;

        // Repeats per second while the increase or decrease keys are held. Zero disables auto-repeat.
        int repeatRate;

        BindingConfiguration();
        void validate();
    };

    extern void to_json(json &j, const ConvergenceConfiguration &cfg);
    extern void from_json(const json &j, ConvergenceConfiguration &cfg);
    extern void to_json(json &j, const BindingConfiguration &cfg);
    extern void from_json(const json &j, BindingConfiguration &cfg);

    struct ConfigurationJSON {
        static bool read(ConvergenceConfiguration &cfg, BindingConfiguration &bindings, std::istream &stream);
        static bool write(const ConvergenceConfiguration &cfg, const BindingConfiguration &bindings, std::ostream &stream);
    };
};
