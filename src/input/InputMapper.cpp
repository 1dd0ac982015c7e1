#include "input/InputMapper.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace
{

struct ModifierName
{
    const char *name;
    int mod;
};

constexpr ModifierName kModifierNames[] = {
    {"shift", KMOD_SHIFT}, {"ctrl", KMOD_CTRL}, {"control", KMOD_CTRL}, {"alt", KMOD_ALT},
    {"gui", KMOD_GUI},     {"meta", KMOD_GUI},  {"super", KMOD_GUI},    {"cmd", KMOD_GUI},
};

std::string lowered(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

std::string trimmed(const std::string &text)
{
    const auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    const auto first = std::find_if_not(text.begin(), text.end(), isSpace);
    const auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    return first < last ? std::string(first, last) : std::string();
}

Uint8 mouseButton(const std::string &name)
{
    const std::string key = lowered(trimmed(name));
    if (key == "mouseleft")
    {
        return SDL_BUTTON_LEFT;
    }
    if (key == "mouseright")
    {
        return SDL_BUTTON_RIGHT;
    }
    if (key == "mousemiddle")
    {
        return SDL_BUTTON_MIDDLE;
    }
    return 0;
}

} // namespace

void InputMapper::configure(const InputBindings &bindings)
{
    const std::pair<const std::string *, ActionId> table[] = {
        {&bindings.quit, ActionId::Quit},
        {&bindings.save, ActionId::SaveDrawing},
        {&bindings.exportDrawing, ActionId::ExportDrawing},
        {&bindings.drawExteriorWall, ActionId::DrawExteriorWall},
        {&bindings.drawInteriorWall, ActionId::DrawInteriorWall},
        {&bindings.measure, ActionId::Measure},
        {&bindings.cancel, ActionId::CancelPlacement},
        {&bindings.toggleGrid, ActionId::ToggleGrid},
        {&bindings.placePoint, ActionId::PlacePoint},
        {&bindings.addText, ActionId::AddText},
        {&bindings.confirmText, ActionId::ConfirmText},
        {&bindings.eraseText, ActionId::EraseText},
        {&bindings.resetCamera, ActionId::ResetCamera},
        {&bindings.pan, ActionId::Pan},
    };

    m_bindings.clear();
    for (const auto &entry : table)
    {
        if (auto binding = parseBinding(*entry.first))
        {
            binding->action = entry.second;
            m_bindings.push_back(*binding);
        }
    }

    m_bufferFrames = static_cast<std::size_t>(std::max(1, bindings.bufferFrames));
    m_bufferExpiryMs = std::max(0.0, static_cast<double>(bindings.bufferExpiryMs));
    beginEventPump();
}

void InputMapper::beginEventPump()
{
    m_pending.clear();
    m_drops.clear();
    m_text.clear();
    m_wheel = 0;
    m_quit = false;
}

void InputMapper::handleEvent(const SDL_Event &event)
{
    switch (event.type)
    {
    case SDL_QUIT:
        m_quit = true;
        break;
    case SDL_KEYDOWN:
        onKeyDown(event.key);
        break;
    case SDL_TEXTINPUT:
        m_text += event.text.text;
        break;
    case SDL_MOUSEMOTION:
        m_pointer.hasPosition = true;
        m_pointer.x = event.motion.x;
        m_pointer.y = event.motion.y;
        m_pointer.left = (event.motion.state & SDL_BUTTON_LMASK) != 0;
        m_pointer.right = (event.motion.state & SDL_BUTTON_RMASK) != 0;
        break;
    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP:
        onButton(event.button, event.type == SDL_MOUSEBUTTONDOWN);
        break;
    case SDL_MOUSEWHEEL:
        m_wheel += event.wheel.direction == SDL_MOUSEWHEEL_FLIPPED ? -event.wheel.y : event.wheel.y;
        break;
    case SDL_DROPFILE:
        if (event.drop.file)
        {
            m_drops.emplace_back(event.drop.file);
            SDL_free(event.drop.file);
        }
        break;
    default:
        break;
    }
}

void InputMapper::onKeyDown(const SDL_KeyboardEvent &key)
{
    const bool repeatable = key.keysym.scancode == SDL_SCANCODE_BACKSPACE;
    if (key.repeat != 0 && !repeatable)
    {
        return;
    }
    const SDL_Keymod mods = normalizeModifiers(key.keysym.mod);
    for (const Binding &binding : m_bindings)
    {
        if (binding.button == 0 && binding.scancode == key.keysym.scancode && binding.modifiers == mods)
        {
            ActionEvent evt;
            evt.id = binding.action;
            evt.pressed = true;
            m_pending.push_back(evt);
        }
    }
}

void InputMapper::onButton(const SDL_MouseButtonEvent &button, bool pressed)
{
    m_pointer.hasPosition = true;
    m_pointer.x = button.x;
    m_pointer.y = button.y;
    if (button.button == SDL_BUTTON_LEFT)
    {
        m_pointer.left = pressed;
    }
    else if (button.button == SDL_BUTTON_RIGHT)
    {
        m_pointer.right = pressed;
    }

    for (const Binding &binding : m_bindings)
    {
        if (binding.button != button.button)
        {
            continue;
        }
        ActionEvent evt;
        evt.id = binding.action;
        evt.pressed = pressed;
        evt.released = !pressed;
        evt.pointer = PointerPayload{button.x, button.y};
        m_pending.push_back(evt);
    }
}

void InputMapper::sampleFrame(double timestampMs, std::uint64_t frameSequence, ActionBuffer &buffer)
{
    if (buffer.capacity() != m_bufferFrames)
    {
        buffer.setCapacity(m_bufferFrames);
    }
    if (m_bufferExpiryMs > 0.0)
    {
        buffer.expireOlderThan(timestampMs - m_bufferExpiryMs);
    }

    ActionBuffer::Frame frame;
    frame.sequence = frameSequence;
    frame.timestampMs = timestampMs;
    frame.events = std::move(m_pending);
    frame.droppedFiles = std::move(m_drops);
    frame.text = std::move(m_text);
    frame.wheel = m_wheel;
    frame.pointer = m_pointer;
    frame.quitRequested = m_quit;
    buffer.pushFrame(std::move(frame));

    beginEventPump();
}

std::optional<InputMapper::Binding> InputMapper::parseBinding(const std::string &name)
{
    Binding binding;
    binding.button = mouseButton(name);
    if (binding.button != 0)
    {
        return binding;
    }

    // "Ctrl+Shift+S": every token before the last is a modifier.
    std::vector<std::string> tokens;
    std::size_t start = 0;
    while (start <= name.size())
    {
        const std::size_t plus = name.find('+', start);
        const std::string token = trimmed(name.substr(start, plus == std::string::npos ? std::string::npos : plus - start));
        if (!token.empty())
        {
            tokens.push_back(token);
        }
        if (plus == std::string::npos)
        {
            break;
        }
        start = plus + 1;
    }
    if (tokens.empty())
    {
        return std::nullopt;
    }

    binding.scancode = SDL_GetScancodeFromName(tokens.back().c_str());
    if (binding.scancode == SDL_SCANCODE_UNKNOWN)
    {
        return std::nullopt;
    }
    tokens.pop_back();

    Uint16 mods = KMOD_NONE;
    for (const std::string &token : tokens)
    {
        const std::string key = lowered(token);
        const auto it = std::find_if(std::begin(kModifierNames), std::end(kModifierNames),
                                     [&key](const ModifierName &modifier) { return key == modifier.name; });
        if (it == std::end(kModifierNames))
        {
            return std::nullopt;
        }
        mods = static_cast<Uint16>(mods | it->mod);
    }
    binding.modifiers = normalizeModifiers(mods);
    return binding;
}

bool InputMapper::isValidBinding(const std::string &name)
{
    return parseBinding(name).has_value();
}

// Left and right variants of a modifier compare equal.
SDL_Keymod InputMapper::normalizeModifiers(Uint16 mods)
{
    constexpr int kGroups[] = {KMOD_SHIFT, KMOD_CTRL, KMOD_ALT, KMOD_GUI};
    int normalized = KMOD_NONE;
    for (int group : kGroups)
    {
        if (mods & group)
        {
            normalized |= group;
        }
    }
    return static_cast<SDL_Keymod>(normalized);
}
