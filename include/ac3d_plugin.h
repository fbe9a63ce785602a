//
// AC3D
//

#ifndef AC3D_PLUGIN_H
#define AC3D_PLUGIN_H

#define AC3D_DIRECTION_INCREASE     0
#define AC3D_DIRECTION_DECREASE     1

// Same bits as SDL's KMOD_* values.
#define AC3D_MODIFIER_NONE          0x0000
#define AC3D_MODIFIER_LSHIFT        0x0001
#define AC3D_MODIFIER_RSHIFT        0x0002
#define AC3D_MODIFIER_LCTRL         0x0040
#define AC3D_MODIFIER_RCTRL         0x0080
#define AC3D_MODIFIER_LALT          0x0100
#define AC3D_MODIFIER_RALT          0x0200

#ifdef __cplusplus
extern "C" {
#endif

// Called every frame with the popout and the convergence distance the stereo driver should use.
typedef void (*AC3D_ApplyPopoutCallback)(float popout, float convergence, void *userData);

// Called when the popout is changed with the manual keys so the host can display it.
typedef void (*AC3D_ShowPopoutCallback)(float popout, void *userData);

// Returns 1 if auto-convergence is running. Returns 0 if the configuration was rejected, in which case the
// session keeps working with a static popout and AC3D_GetLastError() describes the problem.
int AC3D_Initialize(const char *configurationPath, AC3D_ApplyPopoutCallback applyCallback, AC3D_ShowPopoutCallback showCallback, void *userData);
void AC3D_Shutdown(void);

// A negative delta time lets the plugin measure the time between frames on its own.
float AC3D_UpdateFrame(float nearestDepth, float deltaTime);

// Projection is sixteen floats in row-major order, as used by row-vector shaders.
float AC3D_UpdateFrameDeviceDepth(const float *projection, float deviceDepth, float deltaTime);

// Same as above when the host only has the model-view and model-view-projection matrices.
float AC3D_UpdateFrameModelViewDepth(const float *modelView, const float *modelViewProjection, float deviceDepth, float deltaTime);

void AC3D_ToggleEnabled(void);
void AC3D_AdjustPopout(int direction);
float AC3D_GetPopout(void);
int AC3D_IsLockedLow(void);

// Feeds a key press or release using SDL keycodes. Returns 1 if the event was consumed.
int AC3D_ProcessKeyEvent(int keycode, int modifiers, int pressed);

const char *AC3D_GetLastError(void);

#ifdef __cplusplus
};
#endif

#endif
