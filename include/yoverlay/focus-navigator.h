#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace yoverlay {

//=============================================================================
// Option — one entry of a navigable list
//
// Identity is the id, never the label: two options may share a label.
//=============================================================================
struct Option {
    std::string id;
    std::string label;
    bool disabled = false;
};

enum class FocusDirection : uint8_t {
    First,
    Last,
    Up,
    Down,
};

const char* focusDirectionName(FocusDirection direction);

//=============================================================================
// FocusNavigator — keyboard focus over the enabled options of a list
//
// Focus is held by id and looked up on demand; it does not own the option.
// Up/Down wrap around the enabled subset in both directions.
//=============================================================================
class FocusNavigator {
public:
    FocusNavigator() = default;
    explicit FocusNavigator(std::vector<Option> options);

    // Replace the option list. A focus that no longer names an enabled
    // option is dropped.
    void setOptions(std::vector<Option> options);
    const std::vector<Option>& options() const { return _options; }

    // Ordered subsequence of options with disabled == false
    std::vector<const Option*> enabledOptions() const;

    // Unconditional, used for pointer hover. Callers must not pass a
    // disabled option.
    void setFocus(const Option& option);

    // No-op when no option is enabled
    void moveFocus(FocusDirection direction);

    bool isDisabled(const Option& option) const { return option.disabled; }

    const std::optional<std::string>& focusedId() const { return _focusedId; }

    // Current focus resolved against the option list, nullptr if none
    const Option* focused() const;

private:
    std::vector<Option> _options;
    std::optional<std::string> _focusedId;
};

} // namespace yoverlay
