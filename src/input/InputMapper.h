#pragma once

#include "config/AppConfig.h"
#include "input/ActionBuffer.h"

#include <SDL.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Turns raw SDL events into ActionEvents according to InputBindings. Everything
// seen between beginEventPump() and sampleFrame() becomes one frame.
class InputMapper
{
  public:
    void configure(const InputBindings &bindings);

    void beginEventPump();
    void handleEvent(const SDL_Event &event);

    void sampleFrame(double timestampMs, std::uint64_t frameSequence, ActionBuffer &buffer);

    // Accepts "MouseLeft"/"MouseRight"/"MouseMiddle" or an SDL key name with
    // optional "Ctrl+", "Shift+", "Alt+" or "Gui+" prefixes.
    static bool isValidBinding(const std::string &name);

  private:
    struct Binding
    {
        ActionId action = ActionId::Count;
        // Non-zero for mouse buttons; otherwise scancode and modifiers apply.
        Uint8 button = 0;
        SDL_Scancode scancode = SDL_SCANCODE_UNKNOWN;
        SDL_Keymod modifiers = KMOD_NONE;
    };

    static std::optional<Binding> parseBinding(const std::string &name);
    static SDL_Keymod normalizeModifiers(Uint16 mods);

    void onKeyDown(const SDL_KeyboardEvent &key);
    void onButton(const SDL_MouseButtonEvent &button, bool pressed);

    std::vector<Binding> m_bindings;
    std::size_t m_bufferFrames = 2;
    double m_bufferExpiryMs = 100.0;

    std::vector<ActionEvent> m_pending;
    std::vector<std::string> m_drops;
    std::string m_text;
    int m_wheel = 0;
    PointerState m_pointer;
    bool m_quit = false;
};
