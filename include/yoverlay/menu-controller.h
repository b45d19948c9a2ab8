#pragma once

#include "focus-navigator.h"
#include "geometry.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace yoverlay {

//=============================================================================
// Keys understood by the menu trigger
//=============================================================================
enum class Key : uint8_t {
    Unknown,
    Enter,
    Space,
    ArrowUp,
    ArrowDown,
    Escape,
    Tab,
    Home,
    End,
};

// Host key identifiers: "Enter", " ", "ArrowUp", ... Anything else is Unknown.
Key parseKey(std::string_view name);
const char* keyName(Key key);

//=============================================================================
// Close-on-select policy
//=============================================================================
struct CloseAlways {};
struct CloseNever {};
struct CloseWhen {
    std::function<bool(const Option&)> predicate;
};

using CloseOnSelect = std::variant<CloseAlways, CloseNever, CloseWhen>;

bool shouldCloseOnSelect(const CloseOnSelect& policy, const Option& option);

struct MenuConfig {
    bool isOpen = false;
    CloseOnSelect closeOnSelect = CloseAlways{};
    Placement position{Side::Bottom, Align::End};
};

// Every callback is optional
struct MenuCallbacks {
    std::function<void()> onOpen;
    std::function<void()> onClose;
    std::function<void(const Option&)> onSelect;
    std::function<void(const Option&)> onHover;
};

// Snapshot handed to subscribers
struct MenuState {
    bool isOpen = false;
    std::optional<std::string> focusedId;
};

//=============================================================================
// MenuController — open/closed state machine with keyboard navigation
//
// toggle() is level-triggered: the open or close callback fires on every
// call, whether or not isOpen actually changed.
//
// Callbacks and subscribers run synchronously on the calling thread. A
// callback that calls back into the controller re-enters it immediately;
// bounding that recursion is up to the caller.
//=============================================================================
class MenuController {
public:
    using Listener = std::function<void(const MenuState&)>;
    using SubscriptionId = uint64_t;

    explicit MenuController(std::vector<Option> options,
                            MenuConfig config = {},
                            MenuCallbacks callbacks = {});

    // State
    bool isOpen() const { return _isOpen; }
    MenuState state() const { return MenuState{_isOpen, _navigator.focusedId()}; }
    const Option* focusedOption() const { return _navigator.focused(); }
    const FocusNavigator& navigator() const { return _navigator; }
    const MenuConfig& config() const { return _config; }

    void setOptions(std::vector<Option> options);
    void setCloseOnSelect(CloseOnSelect policy) { _config.closeOnSelect = std::move(policy); }

    // Transitions
    void toggle(bool open);
    // Options are taken by value: callbacks may replace the option list
    void selectOption(Option option);
    void hoverOption(Option option);
    void click() { toggle(!_isOpen); }
    void dismiss() { toggle(false); }

    // Navigation
    void moveFocus(FocusDirection direction);
    void setFocus(const Option& option);

    // Returns true when the key was consumed (default action suppressed)
    bool handleKey(Key key);
    bool handleKey(std::string_view name) { return handleKey(parseKey(name)); }

    // Subscribers are told about every toggle and every focus change
    SubscriptionId subscribe(Listener listener);
    void unsubscribe(SubscriptionId id);

private:
    void notify();
    void notifyIfFocusChanged(const std::optional<std::string>& before);

    FocusNavigator _navigator;
    MenuConfig _config;
    MenuCallbacks _callbacks;
    bool _isOpen = false;

    std::vector<std::pair<SubscriptionId, Listener>> _listeners;
    SubscriptionId _nextSubscriptionId = 1;
};

} // namespace yoverlay
