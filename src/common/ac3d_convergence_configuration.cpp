//
// AC3D
//

#include "ac3d_convergence_configuration.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>

namespace AC3D {
    void to_json(json &j, const ConvergenceConfiguration &cfg) {
        j["initialPopout"] = cfg.initialPopout;
        j["minConvergence"] = cfg.minConvergence;
        j["maxConvergence"] = cfg.maxConvergence;
        j["popoutDeviationThreshold"] = cfg.popoutDeviationThreshold;
        j["judderDetectionWindow"] = cfg.judderDetectionWindow;
        j["judderThreshold"] = cfg.judderThreshold;
        j["lockDurationSeconds"] = cfg.lockDurationSeconds;
        j["manualStepSize"] = cfg.manualStepSize;
        j["popoutRiseRate"] = cfg.popoutRiseRate;
        j["popoutFallRate"] = cfg.popoutFallRate;
        j["occlusionNearDepth"] = cfg.occlusionNearDepth;
        j["occlusionFarDepth"] = cfg.occlusionFarDepth;
        j["enabledOnStart"] = cfg.enabledOnStart;
    }

    void from_json(const json &j, ConvergenceConfiguration &cfg) {
        ConvergenceConfiguration defaultCfg;
        cfg.initialPopout = j.value("initialPopout", defaultCfg.initialPopout);
        cfg.minConvergence = j.value("minConvergence", defaultCfg.minConvergence);
        cfg.maxConvergence = j.value("maxConvergence", defaultCfg.maxConvergence);
        cfg.popoutDeviationThreshold = j.value("popoutDeviationThreshold", defaultCfg.popoutDeviationThreshold);
        cfg.judderDetectionWindow = j.value("judderDetectionWindow", defaultCfg.judderDetectionWindow);
        cfg.judderThreshold = j.value("judderThreshold", defaultCfg.judderThreshold);
        cfg.lockDurationSeconds = j.value("lockDurationSeconds", defaultCfg.lockDurationSeconds);
        cfg.manualStepSize = j.value("manualStepSize", defaultCfg.manualStepSize);
        cfg.popoutRiseRate = j.value("popoutRiseRate", defaultCfg.popoutRiseRate);
        cfg.popoutFallRate = j.value("popoutFallRate", defaultCfg.popoutFallRate);
        cfg.occlusionNearDepth = j.value("occlusionNearDepth", defaultCfg.occlusionNearDepth);
        cfg.occlusionFarDepth = j.value("occlusionFarDepth", defaultCfg.occlusionFarDepth);
        cfg.enabledOnStart = j.value("enabledOnStart", defaultCfg.enabledOnStart);
    }

    void to_json(json &j, const BindingConfiguration &cfg) {
        j["toggleKey"] = cfg.toggleKey;
        j["increaseKey"] = cfg.increaseKey;
        j["decreaseKey"] = cfg.decreaseKey;
        j["repeatRate"] = cfg.repeatRate;
    }

    void from_json(const json &j, BindingConfiguration &cfg) {
        BindingConfiguration defaultCfg;
        cfg.toggleKey = j.value("toggleKey", defaultCfg.toggleKey);
        cfg.increaseKey = j.value("increaseKey", defaultCfg.increaseKey);
        cfg.decreaseKey = j.value("decreaseKey", defaultCfg.decreaseKey);
        cfg.repeatRate = j.value("repeatRate", defaultCfg.repeatRate);
    }

    // ConvergenceConfiguration

    const int ConvergenceConfiguration::MinJudderDetectionWindow = 3;

    ConvergenceConfiguration::ConvergenceConfiguration() {
        initialPopout = 0.3f;
        minConvergence = 0.0f;
        maxConvergence = 1.0f;
        popoutDeviationThreshold = 0.01f;
        judderDetectionWindow = 16;
        judderThreshold = 6;
        lockDurationSeconds = 2.0f;
        manualStepSize = 0.05f;
        popoutRiseRate = 0.25f;
        popoutFallRate = 1.0f;
        occlusionNearDepth = 1.0f;
        occlusionFarDepth = 10.0f;
        enabledOnStart = true;
    }

    bool ConvergenceConfiguration::validate(std::string &error) const {
        const float values[] = {
            initialPopout, minConvergence, maxConvergence, popoutDeviationThreshold, lockDurationSeconds,
            manualStepSize, popoutRiseRate, popoutFallRate, occlusionNearDepth, occlusionFarDepth
        };

        for (float value : values) {
            if (!std::isfinite(value)) {
                error = "Configuration contains a value that is not a finite number.";
                return false;
            }
        }

        if (minConvergence > maxConvergence) {
            error = "minConvergence (" + std::to_string(minConvergence) + ") is greater than maxConvergence (" + std::to_string(maxConvergence) + ").";
            return false;
        }

        if ((initialPopout < minConvergence) || (initialPopout > maxConvergence)) {
            error = "initialPopout (" + std::to_string(initialPopout) + ") is outside of the [minConvergence, maxConvergence] range.";
            return false;
        }

        if (popoutDeviationThreshold < 0.0f) {
            error = "popoutDeviationThreshold must not be negative.";
            return false;
        }

        if (judderDetectionWindow < MinJudderDetectionWindow) {
            error = "judderDetectionWindow must hold at least " + std::to_string(MinJudderDetectionWindow) + " samples.";
            return false;
        }

        if (judderThreshold < 0) {
            error = "judderThreshold must not be negative.";
            return false;
        }

        // A window of N samples holds at most N - 2 changes of direction.
        if (judderThreshold >= judderDetectionWindow - 2) {
            error = "judderThreshold (" + std::to_string(judderThreshold) + ") must be smaller than judderDetectionWindow - 2 (" + std::to_string(judderDetectionWindow - 2) + ").";
            return false;
        }

        if (lockDurationSeconds < 0.0f) {
            error = "lockDurationSeconds must not be negative.";
            return false;
        }

        if (manualStepSize <= 0.0f) {
            error = "manualStepSize must be greater than zero.";
            return false;
        }

        if ((popoutRiseRate <= 0.0f) || (popoutFallRate <= 0.0f)) {
            error = "popoutRiseRate and popoutFallRate must be greater than zero.";
            return false;
        }

        if ((occlusionNearDepth < 0.0f) || (occlusionNearDepth >= occlusionFarDepth)) {
            error = "occlusionNearDepth must be positive and smaller than occlusionFarDepth.";
            return false;
        }

        return true;
    }

    // BindingConfiguration

    BindingConfiguration::BindingConfiguration() {
        toggleKey = "F5";
        increaseKey = "F6";
        decreaseKey = "Shift+F6";
        repeatRate = 8;
    }

    void BindingConfiguration::validate() {
        repeatRate = std::clamp<int>(repeatRate, 0, 60);
    }

    // ConfigurationJSON

    bool ConfigurationJSON::read(ConvergenceConfiguration &cfg, BindingConfiguration &bindings, std::istream &stream) {
        try {
            json jroot;
            stream >> jroot;
            cfg = jroot.value("configuration", ConvergenceConfiguration());
            bindings = jroot.value("bindings", BindingConfiguration());
            bindings.validate();
            return !stream.bad();
        }
        catch (const nlohmann::detail::exception &e) {
            fprintf(stderr, "JSON parsing error: %s\n", e.what());
            cfg = ConvergenceConfiguration();
            bindings = BindingConfiguration();
            return false;
        }
    }

    bool ConfigurationJSON::write(const ConvergenceConfiguration &cfg, const BindingConfiguration &bindings, std::ostream &stream) {
        json jroot;
        jroot["configuration"] = cfg;
        jroot["bindings"] = bindings;
        stream << std::setw(4) << jroot << std::endl;
        return !stream.bad();
    }
};
