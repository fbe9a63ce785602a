//
// AC3D
//

#include "ac3d_input.h"

#include <algorithm>
#include <cctype>

#include "common/ac3d_common.h"

namespace AC3D {
    static std::string trimmed(const std::string &text) {
        size_t start = 0;
        size_t end = text.size();
        while ((start < end) && std::isspace(static_cast<unsigned char>(text[start]))) {
            start++;
        }

        while ((end > start) && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
            end--;
        }

        return text.substr(start, end - start);
    }

    static std::string lowercase(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return char(std::tolower(c)); });
        return text;
    }

    // KeyChord

    bool KeyChord::parse(const std::string &text, KeyChord &chord) {
        chord = KeyChord();

        // The last '+' that isn't the final character separates the key from the modifiers, so "Keypad +" still works.
        std::vector<std::string> tokens;
        size_t tokenStart = 0;
        for (size_t i = 0; i < text.size(); i++) {
            if ((text[i] == '+') && (i > tokenStart) && (i + 1 < text.size())) {
                tokens.emplace_back(trimmed(text.substr(tokenStart, i - tokenStart)));
                tokenStart = i + 1;
            }
        }

        tokens.emplace_back(trimmed(text.substr(tokenStart)));
        if (tokens.back().empty()) {
            return false;
        }

        for (size_t i = 0; i + 1 < tokens.size(); i++) {
            const std::string modifier = lowercase(tokens[i]);
            if (modifier == "shift") {
                chord.modifiers |= ModifierShift;
            }
            else if ((modifier == "ctrl") || (modifier == "control")) {
                chord.modifiers |= ModifierCtrl;
            }
            else if (modifier == "alt") {
                chord.modifiers |= ModifierAlt;
            }
            else {
                return false;
            }
        }

        chord.key = SDL_GetKeyFromName(tokens.back().c_str());
        return chord.isValid();
    }

    uint32_t KeyChord::modifiersFromSDL(uint16_t sdlModifiers) {
        uint32_t modifiers = ModifierNone;
        if (sdlModifiers & KMOD_SHIFT) {
            modifiers |= ModifierShift;
        }

        if (sdlModifiers & KMOD_CTRL) {
            modifiers |= ModifierCtrl;
        }

        if (sdlModifiers & KMOD_ALT) {
            modifiers |= ModifierAlt;
        }

        return modifiers;
    }

    bool KeyChord::isValid() const {
        return (key != SDLK_UNKNOWN);
    }

    // KeyboardState

    bool KeyboardState::isHeld(const KeyChord &chord) const {
        if (!chord.isValid()) {
            return false;
        }

        return (heldKeys.find(chord.key) != heldKeys.end()) && (modifiers == chord.modifiers);
    }

    // InputAction

    InputAction::InputAction(const KeyChord &chord, const std::function<void()> &callback) {
        this->chord = chord;
        this->callback = callback;
    }

    InputAction::~InputAction() { }

    bool InputAction::dispatch(const KeyboardState &keyboard, double time) {
        const bool state = keyboard.isHeld(chord);
        const bool fire = state && !lastState;
        lastState = state;
        if (fire && callback) {
            callback();
        }

        return fire;
    }

    // RepeatingInputAction

    RepeatingInputAction::RepeatingInputAction(const KeyChord &chord, const std::function<void()> &callback, int repeatRate)
        : InputAction(chord, callback)
    {
        this->repeatRate = repeatRate;
    }

    bool RepeatingInputAction::dispatch(const KeyboardState &keyboard, double time) {
        const bool wasHeld = lastState;
        if (InputAction::dispatch(keyboard, time)) {
            lastFireTime = time;
            return true;
        }

        if (!wasHeld || !lastState || (repeatRate <= 0)) {
            return false;
        }

        const double repeatInterval = 1.0 / double(repeatRate);
        if ((time - lastFireTime) < repeatInterval) {
            return false;
        }

        lastFireTime = time;
        if (callback) {
            callback();
        }

        return true;
    }

    // InputDispatcher

    bool InputDispatcher::registerAction(const std::string &chordText, const std::function<void()> &callback, int repeatRate) {
        KeyChord chord;
        if (!KeyChord::parse(chordText, chord)) {
            fprintf(stderr, "Unable to parse key binding \"%s\".\n", chordText.c_str());
            return false;
        }

        if (repeatRate > 0) {
            actions.emplace_back(std::make_unique<RepeatingInputAction>(chord, callback, repeatRate));
        }
        else {
            actions.emplace_back(std::make_unique<InputAction>(chord, callback));
        }

        AC3D_LOG_PRINTF("Registered key binding \"%s\" with repeat rate %d.", chordText.c_str(), repeatRate);
        return true;
    }

    void InputDispatcher::clearActions() {
        actions.clear();
    }

    bool InputDispatcher::processEvent(const SDL_Event &event) {
        switch (event.type) {
        case SDL_KEYDOWN:
            keyboard.heldKeys.insert(event.key.keysym.sym);
            keyboard.modifiers = KeyChord::modifiersFromSDL(event.key.keysym.mod);
            return true;
        case SDL_KEYUP:
            keyboard.heldKeys.erase(event.key.keysym.sym);
            keyboard.modifiers = KeyChord::modifiersFromSDL(event.key.keysym.mod);
            return true;
        default:
            return false;
        }
    }

    void InputDispatcher::dispatch(double deltaTime) {
        time += std::max(deltaTime, 0.0);
        for (const std::unique_ptr<InputAction> &action : actions) {
            action->dispatch(keyboard, time);
        }
    }
};
