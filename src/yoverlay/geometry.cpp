#include "yoverlay/geometry.h"

namespace yoverlay {

const char* sideName(Side side) {
    switch (side) {
        case Side::Top:    return "top";
        case Side::Right:  return "right";
        case Side::Bottom: return "bottom";
        case Side::Left:   return "left";
    }
    return "top";
}

const char* alignName(Align align) {
    switch (align) {
        case Align::Center: return "center";
        case Align::Start:  return "start";
        case Align::End:    return "end";
    }
    return "center";
}

std::string placementName(const Placement& placement) {
    std::string name = sideName(placement.side);
    if (placement.align != Align::Center) {
        name += "-";
        name += alignName(placement.align);
    }
    return name;
}

bool isSideName(std::string_view name) {
    return name == "top" || name == "right" || name == "bottom" || name == "left";
}

Side parseSide(std::string_view name) {
    if (name == "right")  return Side::Right;
    if (name == "bottom") return Side::Bottom;
    if (name == "left")   return Side::Left;
    return Side::Top;
}

Placement parsePlacement(std::string_view name) {
    auto dash = name.find('-');
    std::string_view sidePart = name.substr(0, dash);
    std::string_view alignPart = dash == std::string_view::npos
        ? std::string_view{} : name.substr(dash + 1);

    if (!isSideName(sidePart)) return Placement{};

    Placement placement{parseSide(sidePart), Align::Center};
    if (alignPart == "start") {
        placement.align = Align::Start;
    } else if (alignPart == "end") {
        placement.align = Align::End;
    } else if (!alignPart.empty() && alignPart != "center") {
        return Placement{};
    }
    return placement;
}

} // namespace yoverlay
