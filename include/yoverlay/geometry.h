#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace yoverlay {

//=============================================================================
// Rect — measured element box in viewport coordinates
//
// Produced by the host layout pass; the engine never measures anything.
//=============================================================================
struct Rect {
    float top = 0, right = 0, bottom = 0, left = 0;
    float width = 0, height = 0;

    static Rect fromXYWH(float x, float y, float w, float h) {
        return Rect{y, x + w, y + h, x, w, h};
    }

    // Overlays are only ever sized, not placed, when handed to the resolver
    static Rect fromSize(float w, float h) { return fromXYWH(0, 0, w, h); }
};

//=============================================================================
// Viewport — visible client area
//=============================================================================
struct Viewport {
    float width = 0;
    float height = 0;

    // Inner window size, falling back to the document client size per axis
    // when the window reports zero.
    static Viewport fromWindow(float innerWidth, float innerHeight,
                               float clientWidth, float clientHeight) {
        return Viewport{innerWidth != 0 ? innerWidth : clientWidth,
                        innerHeight != 0 ? innerHeight : clientHeight};
    }
};

enum class Side : uint8_t {
    Top,
    Right,
    Bottom,
    Left,
};

enum class Align : uint8_t {
    Center,
    Start,
    End,
};

// Compound position such as "bottom-end"
struct Placement {
    Side side = Side::Top;
    Align align = Align::Center;

    bool operator==(const Placement&) const = default;
};

const char* sideName(Side side);
const char* alignName(Align align);
std::string placementName(const Placement& placement);

bool isSideName(std::string_view name);

// Unknown names fall back to Side::Top
Side parseSide(std::string_view name);

// "bottom-end" -> {Bottom, End}, "left" -> {Left, Center}; unknown -> {Top, Center}
Placement parsePlacement(std::string_view name);

} // namespace yoverlay
