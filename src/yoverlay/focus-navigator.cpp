#include "yoverlay/focus-navigator.h"
#include <ytrace/ytrace.hpp>
#include <utility>

namespace yoverlay {

const char* focusDirectionName(FocusDirection direction) {
    switch (direction) {
        case FocusDirection::First: return "first";
        case FocusDirection::Last:  return "last";
        case FocusDirection::Up:    return "up";
        case FocusDirection::Down:  return "down";
    }
    return "first";
}

FocusNavigator::FocusNavigator(std::vector<Option> options)
    : _options(std::move(options)) {}

void FocusNavigator::setOptions(std::vector<Option> options) {
    _options = std::move(options);
    if (!_focusedId) return;

    for (const auto* option : enabledOptions()) {
        if (option->id == *_focusedId) return;
    }
    ydebug("FocusNavigator: focus '{}' dropped, no longer an enabled option", *_focusedId);
    _focusedId.reset();
}

std::vector<const Option*> FocusNavigator::enabledOptions() const {
    std::vector<const Option*> enabled;
    enabled.reserve(_options.size());
    for (const auto& option : _options) {
        if (!isDisabled(option))
            enabled.push_back(&option);
    }
    return enabled;
}

void FocusNavigator::setFocus(const Option& option) {
    _focusedId = option.id;
}

void FocusNavigator::moveFocus(FocusDirection direction) {
    auto enabled = enabledOptions();
    if (enabled.empty()) return;

    const int count = static_cast<int>(enabled.size());
    int current = -1;
    if (_focusedId) {
        for (int i = 0; i < count; i++) {
            if (enabled[i]->id == *_focusedId) {
                current = i;
                break;
            }
        }
    }

    int next = 0;
    switch (direction) {
        case FocusDirection::Up:
            next = current > 0 ? current - 1 : count - 1;
            break;
        case FocusDirection::Down:
            // From no focus (-1) this lands on the first enabled option
            next = (current + 1) % count;
            break;
        case FocusDirection::Last:
            next = count - 1;
            break;
        case FocusDirection::First:
            next = 0;
            break;
    }

    _focusedId = enabled[next]->id;
    ytrace("FocusNavigator: move {} {} -> {} ('{}')",
           focusDirectionName(direction), current, next, *_focusedId);
}

const Option* FocusNavigator::focused() const {
    if (!_focusedId) return nullptr;
    for (const auto& option : _options) {
        if (option.id == *_focusedId) return &option;
    }
    return nullptr;
}

} // namespace yoverlay
