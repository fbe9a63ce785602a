//
// AC3D
//

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <plainargs/plainargs.h>

#include "host/ac3d_host_session.h"

struct TracePrinter : AC3D::StereoOutput, AC3D::PopoutDisplay {
    const AC3D::HostSession *session = nullptr;
    uint32_t frameIndex = 0;
    float depth = 0.0f;
    float intrusion = 0.0f;

    void applyPopout(float popout, float convergence) override {
        const char *state = session->isLockedLow() ? "locked" : "tracking";
        fprintf(stdout, "%u,%f,%f,%f,%f,%s\n", frameIndex, depth, intrusion, popout, convergence, state);
    }

    void showPopout(float popout) override {
        fprintf(stdout, "# popout %f\n", popout);
    }
};

void showHelp() {
    fprintf(stdout,
        "convergence_sim <trace> [--config path] [--fps number]\n"
        "\tReplay a depth trace through the auto-convergence controller and print one CSV row per frame.\n"
        "\tEach line of the trace holds the linear depth of the nearest geometry for one frame, or one of\n"
        "\tthe commands 'toggle', 'increase' and 'decrease'. Lines starting with '#' are ignored.\n"
        "\tUse '--config path' to load the controller configuration. The defaults are used otherwise.\n"
        "\tUse '--fps number' to set the simulated frame rate. Defaults to 60.\n\n"
        "convergence_sim --write-default path\n"
        "\tWrite the default configuration to the given path.\n"
    );
}

int main(int argc, char *argv[]) {
    plainargs::Result args = plainargs::parse(argc, argv);
    if (args.hasOption("write-default", "w")) {
        std::filesystem::path outputPath = std::filesystem::u8path(args.getValue("write-default", "w"));
        std::ofstream outputStream(outputPath);
        if (!outputStream.is_open() || !AC3D::ConfigurationJSON::write(AC3D::ConvergenceConfiguration(), AC3D::BindingConfiguration(), outputStream)) {
            std::string u8string = outputPath.u8string();
            fprintf(stderr, "Failed to write the default configuration to %s.\n", u8string.c_str());
            return 1;
        }

        return 0;
    }

    if (args.getArgumentCount() < 1) {
        showHelp();
        return 1;
    }

    std::filesystem::path tracePath = std::filesystem::u8path(args.getArgument(0));
    std::ifstream traceStream(tracePath);
    if (!traceStream.is_open()) {
        std::string u8string = tracePath.u8string();
        fprintf(stderr, "Failed to open trace file at %s.\n", u8string.c_str());
        return 1;
    }

    float framesPerSecond = 60.0f;
    std::string fpsValue = args.getValue("fps");
    if (!fpsValue.empty()) {
        try {
            framesPerSecond = std::stof(fpsValue);
        }
        catch (const std::exception &e) {
            fprintf(stderr, "Invalid frame rate %s: %s\n", fpsValue.c_str(), e.what());
            return 1;
        }

        if (!std::isfinite(framesPerSecond) || (framesPerSecond <= 0.0f)) {
            fprintf(stderr, "The frame rate must be greater than zero.\n");
            return 1;
        }
    }

    TracePrinter printer;
    AC3D::HostSession session(&printer, &printer);
    printer.session = &session;

    std::string configValue = args.getValue("config", "c");
    if (!configValue.empty()) {
        if (!session.initialize(std::filesystem::u8path(configValue))) {
            fprintf(stderr, "Continuing with a static popout of %f.\n", session.getPopout());
        }
    }
    else if (!session.setup(AC3D::ConvergenceConfiguration(), AC3D::BindingConfiguration())) {
        fprintf(stderr, "The default configuration was rejected: %s\n", session.configurationError.c_str());
        return 1;
    }

    const float deltaTime = 1.0f / framesPerSecond;
    fprintf(stdout, "frame,depth,intrusion,popout,convergence,state\n");

    std::string line;
    uint32_t lineNumber = 0;
    while (std::getline(traceStream, line)) {
        lineNumber++;
        if (line.empty() || (line[0] == '#')) {
            continue;
        }

        if (line == "toggle") {
            session.toggleEnabled();
            continue;
        }
        else if (line == "increase") {
            session.adjustManual(AC3D::Direction::Increase);
            continue;
        }
        else if (line == "decrease") {
            session.adjustManual(AC3D::Direction::Decrease);
            continue;
        }

        float depth = 0.0f;
        try {
            depth = std::stof(line);
        }
        catch (const std::exception &e) {
            fprintf(stderr, "Skipping line %u of the trace (%s): %s\n", lineNumber, line.c_str(), e.what());
            continue;
        }

        const AC3D::FrameSample sample = session.depthSignal.fromLinearDepth(depth);
        printer.depth = depth;
        printer.intrusion = sample.intrusion;
        session.frame(sample, deltaTime);
        printer.frameIndex++;
    }

    return 0;
}
