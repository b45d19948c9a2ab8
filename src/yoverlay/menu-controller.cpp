#include "yoverlay/menu-controller.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace yoverlay {

Key parseKey(std::string_view name) {
    if (name == "Enter")     return Key::Enter;
    if (name == " ")         return Key::Space;
    if (name == "ArrowUp")   return Key::ArrowUp;
    if (name == "ArrowDown") return Key::ArrowDown;
    if (name == "Escape")    return Key::Escape;
    if (name == "Tab")       return Key::Tab;
    if (name == "Home")      return Key::Home;
    if (name == "End")       return Key::End;
    return Key::Unknown;
}

const char* keyName(Key key) {
    switch (key) {
        case Key::Enter:     return "Enter";
        case Key::Space:     return " ";
        case Key::ArrowUp:   return "ArrowUp";
        case Key::ArrowDown: return "ArrowDown";
        case Key::Escape:    return "Escape";
        case Key::Tab:       return "Tab";
        case Key::Home:      return "Home";
        case Key::End:       return "End";
        case Key::Unknown:   break;
    }
    return "";
}

bool shouldCloseOnSelect(const CloseOnSelect& policy, const Option& option) {
    if (std::holds_alternative<CloseAlways>(policy)) return true;
    if (std::holds_alternative<CloseNever>(policy)) return false;
    const auto& when = std::get<CloseWhen>(policy);
    // An unset predicate never closes
    return when.predicate ? when.predicate(option) : false;
}

//=============================================================================
// MenuController
//=============================================================================

MenuController::MenuController(std::vector<Option> options,
                               MenuConfig config,
                               MenuCallbacks callbacks)
    : _navigator(std::move(options))
    , _config(std::move(config))
    , _callbacks(std::move(callbacks))
    , _isOpen(_config.isOpen) {}

void MenuController::setOptions(std::vector<Option> options) {
    auto before = _navigator.focusedId();
    _navigator.setOptions(std::move(options));
    notifyIfFocusChanged(before);
}

void MenuController::toggle(bool open) {
    ydebug("MenuController: toggle({}) was {}", open, _isOpen);
    _isOpen = open;

    if (!open) {
        if (_callbacks.onClose) _callbacks.onClose();
    } else if (_callbacks.onOpen) {
        _callbacks.onOpen();
    }
    notify();
}

void MenuController::selectOption(Option option) {
    ydebug("MenuController: select '{}'", option.id);
    if (_callbacks.onSelect) _callbacks.onSelect(option);

    if (shouldCloseOnSelect(_config.closeOnSelect, option))
        toggle(false);
}

void MenuController::hoverOption(Option option) {
    setFocus(option);
    if (_callbacks.onHover) _callbacks.onHover(option);
}

void MenuController::moveFocus(FocusDirection direction) {
    auto before = _navigator.focusedId();
    _navigator.moveFocus(direction);
    notifyIfFocusChanged(before);
}

void MenuController::setFocus(const Option& option) {
    auto before = _navigator.focusedId();
    _navigator.setFocus(option);
    notifyIfFocusChanged(before);
}

bool MenuController::handleKey(Key key) {
    // Decisions are taken against the state at dispatch time, callbacks may
    // change it underneath us.
    const bool wasOpen = _isOpen;

    switch (key) {
        case Key::Escape:
        case Key::Tab:
            // Re-fires the open callback rather than closing; kept as the
            // established behaviour until product decides otherwise.
            if (wasOpen) toggle(wasOpen);
            return false;

        case Key::Enter: {
            std::optional<Option> focused;
            if (const Option* current = _navigator.focused())
                focused = *current;

            if (focused) selectOption(*focused);
            if ((!focused && wasOpen) || !wasOpen) toggle(!wasOpen);
            return true;
        }

        case Key::Space:
            if (!wasOpen) toggle(true);
            return false;

        case Key::ArrowUp:
            moveFocus(FocusDirection::Up);
            return true;

        case Key::ArrowDown:
            moveFocus(FocusDirection::Down);
            return true;

        case Key::Home:
            moveFocus(FocusDirection::First);
            return true;

        case Key::End:
            moveFocus(FocusDirection::Last);
            return true;

        case Key::Unknown:
            break;
    }
    return false;
}

MenuController::SubscriptionId MenuController::subscribe(Listener listener) {
    SubscriptionId id = _nextSubscriptionId++;
    _listeners.emplace_back(id, std::move(listener));
    return id;
}

void MenuController::unsubscribe(SubscriptionId id) {
    _listeners.erase(std::remove_if(_listeners.begin(), _listeners.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     _listeners.end());
}

void MenuController::notify() {
    if (_listeners.empty()) return;
    // Copy so listeners may unsubscribe while being notified
    auto listeners = _listeners;
    MenuState snapshot = state();
    for (auto& entry : listeners) {
        if (entry.second) entry.second(snapshot);
    }
}

void MenuController::notifyIfFocusChanged(const std::optional<std::string>& before) {
    if (_navigator.focusedId() != before) notify();
}

} // namespace yoverlay
