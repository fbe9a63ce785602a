//
// AC3D
//

#pragma once

#include "ac3d_plugin.h"

#include "host/ac3d_host_session.h"

namespace AC3D {
    // Forwards the session's collaborators to the callbacks registered by the host.
    struct CallbackBridge : StereoOutput, PopoutDisplay {
        AC3D_ApplyPopoutCallback applyCallback = nullptr;
        AC3D_ShowPopoutCallback showCallback = nullptr;
        void *userData = nullptr;

        void applyPopout(float popout, float convergence) override;
        void showPopout(float popout) override;
    };

    struct APIContainer {
        std::unique_ptr<HostSession> session;
        CallbackBridge bridge;
    };

    extern APIContainer API;
};
