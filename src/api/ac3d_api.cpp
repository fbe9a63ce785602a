//
// AC3D
//

#include "ac3d_api.h"

#include "common/ac3d_math.h"

namespace AC3D {
    // Global container for the session.
    APIContainer API;

    // CallbackBridge

    void CallbackBridge::applyPopout(float popout, float convergence) {
        if (applyCallback != nullptr) {
            applyCallback(popout, convergence, userData);
        }
    }

    void CallbackBridge::showPopout(float popout) {
        if (showCallback != nullptr) {
            showCallback(popout, userData);
        }
    }

    static hlslpp::float4x4 matrixFromArray(const float *values) {
        return hlslpp::float4x4(
            values[0], values[1], values[2], values[3],
            values[4], values[5], values[6], values[7],
            values[8], values[9], values[10], values[11],
            values[12], values[13], values[14], values[15]);
    }

    static float updateFrame(const FrameSample &sample, float deltaTime) {
        if (deltaTime < 0.0f) {
            return API.session->frame(sample);
        }
        else {
            return API.session->frame(sample, deltaTime);
        }
    }
};

DLLEXPORT int AC3D_Initialize(const char *configurationPath, AC3D_ApplyPopoutCallback applyCallback, AC3D_ShowPopoutCallback showCallback, void *userData) {
    AC3D_LOG_CLOSE();
    AC3D_LOG_OPEN("ac3d.log");

    AC3D::API.bridge.applyCallback = applyCallback;
    AC3D::API.bridge.showCallback = showCallback;
    AC3D::API.bridge.userData = userData;
    AC3D::API.session = std::make_unique<AC3D::HostSession>(&AC3D::API.bridge, &AC3D::API.bridge);
    AC3D::GlobalLastError.clear();

    if (configurationPath == nullptr) {
        return AC3D::API.session->setup(AC3D::ConvergenceConfiguration(), AC3D::BindingConfiguration()) ? 1 : 0;
    }

    return AC3D::API.session->initialize(std::filesystem::u8path(configurationPath)) ? 1 : 0;
}

DLLEXPORT void AC3D_Shutdown(void) {
    AC3D::API.session.reset();
    AC3D::API.bridge = AC3D::CallbackBridge();
    AC3D_LOG_CLOSE();
}

DLLEXPORT float AC3D_UpdateFrame(float nearestDepth, float deltaTime) {
    if (AC3D::API.session == nullptr) {
        return 0.0f;
    }

    const AC3D::FrameSample sample = AC3D::API.session->depthSignal.fromLinearDepth(nearestDepth);
    return AC3D::updateFrame(sample, deltaTime);
}

DLLEXPORT float AC3D_UpdateFrameDeviceDepth(const float *projection, float deviceDepth, float deltaTime) {
    if (AC3D::API.session == nullptr) {
        return 0.0f;
    }

    AC3D::FrameSample sample;
    if (projection != nullptr) {
        sample = AC3D::API.session->depthSignal.fromDeviceDepth(AC3D::matrixFromArray(projection), deviceDepth);
    }

    return AC3D::updateFrame(sample, deltaTime);
}

DLLEXPORT float AC3D_UpdateFrameModelViewDepth(const float *modelView, const float *modelViewProjection, float deviceDepth, float deltaTime) {
    if (AC3D::API.session == nullptr) {
        return 0.0f;
    }

    AC3D::FrameSample sample;
    if ((modelView != nullptr) && (modelViewProjection != nullptr)) {
        sample = AC3D::API.session->depthSignal.fromDeviceDepth(AC3D::matrixFromArray(modelView), AC3D::matrixFromArray(modelViewProjection), deviceDepth);
    }

    return AC3D::updateFrame(sample, deltaTime);
}

DLLEXPORT void AC3D_ToggleEnabled(void) {
    if (AC3D::API.session != nullptr) {
        AC3D::API.session->toggleEnabled();
    }
}

DLLEXPORT void AC3D_AdjustPopout(int direction) {
    if (AC3D::API.session != nullptr) {
        AC3D::API.session->adjustManual((direction == AC3D_DIRECTION_DECREASE) ? AC3D::Direction::Decrease : AC3D::Direction::Increase);
    }
}

DLLEXPORT float AC3D_GetPopout(void) {
    return (AC3D::API.session != nullptr) ? AC3D::API.session->getPopout() : 0.0f;
}

DLLEXPORT int AC3D_IsLockedLow(void) {
    return ((AC3D::API.session != nullptr) && AC3D::API.session->isLockedLow()) ? 1 : 0;
}

DLLEXPORT int AC3D_ProcessKeyEvent(int keycode, int modifiers, int pressed) {
    if (AC3D::API.session == nullptr) {
        return 0;
    }

    SDL_Event event = {};
    event.type = pressed ? SDL_KEYDOWN : SDL_KEYUP;
    event.key.state = pressed ? SDL_PRESSED : SDL_RELEASED;
    event.key.keysym.sym = SDL_Keycode(keycode);
    event.key.keysym.mod = uint16_t(modifiers);
    return AC3D::API.session->processEvent(event) ? 1 : 0;
}

DLLEXPORT const char *AC3D_GetLastError(void) {
    return AC3D::GlobalLastError.c_str();
}
