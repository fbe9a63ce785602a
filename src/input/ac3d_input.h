//
// AC3D
//

#pragma once

#include <functional>
#include <memory>
#include <stddef.h>
#include <string>
#include <unordered_set>
#include <vector>

#include "SDL.h"
#include "SDL_events.h"
#include "SDL_keyboard.h"

namespace AC3D {
    struct KeyChord {
        enum Modifier {
            ModifierNone = 0x0,
            ModifierShift = 0x1,
            ModifierCtrl = 0x2,
            ModifierAlt = 0x4
        };

        SDL_Keycode key = SDLK_UNKNOWN;
        uint32_t modifiers = ModifierNone;

        // Parses chords such as "F5", "Shift+F6" or "Ctrl+Alt+Keypad +". Key names are the ones SDL uses.
        static bool parse(const std::string &text, KeyChord &chord);
        static uint32_t modifiersFromSDL(uint16_t sdlModifiers);
        bool isValid() const;
    };

    struct KeyboardState {
        std::unordered_set<SDL_Keycode> heldKeys;
        uint32_t modifiers = KeyChord::ModifierNone;

        // Modifiers must match exactly so "F6" and "Shift+F6" can be bound to different actions.
        bool isHeld(const KeyChord &chord) const;
    };

    // An action fires its callback once when its chord goes down.
    struct InputAction {
        KeyChord chord;
        std::function<void()> callback;
        bool lastState = false;

        InputAction(const KeyChord &chord, const std::function<void()> &callback);
        virtual ~InputAction();

        // Returns true if the callback was fired.
        virtual bool dispatch(const KeyboardState &keyboard, double time);
    };

    // Fires again at a fixed rate for as long as the chord is held.
    struct RepeatingInputAction : InputAction {
        int repeatRate = 8;
        double lastFireTime = 0.0;

        RepeatingInputAction(const KeyChord &chord, const std::function<void()> &callback, int repeatRate);
        bool dispatch(const KeyboardState &keyboard, double time) override;
    };

    struct InputDispatcher {
        KeyboardState keyboard;
        std::vector<std::unique_ptr<InputAction>> actions;
        double time = 0.0;

        // Returns false if the chord couldn't be parsed and the action was not registered.
        bool registerAction(const std::string &chordText, const std::function<void()> &callback, int repeatRate = 0);
        void clearActions();

        // Returns true if the event was a keyboard event consumed by the dispatcher.
        bool processEvent(const SDL_Event &event);

        // Called once per frame from the render loop.
        void dispatch(double deltaTime);
    };
};
