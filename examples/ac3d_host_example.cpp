//
// AC3D
//

#include <cmath>
#include <cstdio>

#include <SDL.h>

#include "ac3d_plugin.h"

// Stand-in for the stereo driver. A real host would pass the convergence to its stereo API here.
static void applyPopout(float popout, float convergence, void *userData) {
    SDL_Window *window = static_cast<SDL_Window *>(userData);
    char title[128];
    snprintf(title, sizeof(title), "AC3D popout %.3f convergence %.3f%s", popout, convergence, AC3D_IsLockedLow() ? " (locked)" : "");
    SDL_SetWindowTitle(window, title);
}

static void showPopout(float popout, void *userData) {
    fprintf(stdout, "Popout: %.3f\n", popout);
}

int main(int argc, char *argv[]) {
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        fprintf(stderr, "Failed to init SDL2 video: %s\n", SDL_GetError());
        return 1;
    }

    SDL_Window *window = SDL_CreateWindow("AC3D", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 640, 360, 0);
    if (window == nullptr) {
        fprintf(stderr, "Failed to create window: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    const char *configurationPath = (argc > 1) ? argv[1] : nullptr;
    if (!AC3D_Initialize(configurationPath, applyPopout, showPopout, window)) {
        fprintf(stderr, "Auto-convergence is disabled: %s\n", AC3D_GetLastError());
    }

    // Simulated scene where an object periodically moves towards the camera.
    float sceneTime = 0.0f;
    uint64_t lastCounter = SDL_GetPerformanceCounter();
    bool running = true;
    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            switch (event.type) {
            case SDL_QUIT:
                running = false;
                break;
            case SDL_KEYDOWN:
            case SDL_KEYUP:
                AC3D_ProcessKeyEvent(event.key.keysym.sym, event.key.keysym.mod, event.type == SDL_KEYDOWN);
                break;
            default:
                break;
            }
        }

        const uint64_t counter = SDL_GetPerformanceCounter();
        const float deltaTime = float(double(counter - lastCounter) / double(SDL_GetPerformanceFrequency()));
        lastCounter = counter;
        sceneTime += deltaTime;

        const float nearestDepth = 5.5f + 4.5f * std::sin(sceneTime * 0.5f);
        AC3D_UpdateFrame(nearestDepth, deltaTime);
        SDL_Delay(16);
    }

    AC3D_Shutdown();
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
