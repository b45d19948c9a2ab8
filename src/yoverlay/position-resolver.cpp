#include "yoverlay/position-resolver.h"
#include <ytrace/ytrace.hpp>

namespace yoverlay {

bool fitsTop(const Rect& overlay, const Rect& anchor) {
    return anchor.top >= overlay.height;
}

bool fitsBottom(const Rect& overlay, const Rect& anchor, const Viewport& viewport) {
    return overlay.height <= viewport.height - anchor.bottom;
}

bool fitsLeft(const Rect& overlay, const Rect& anchor) {
    return anchor.left >= overlay.width;
}

bool fitsRight(const Rect& overlay, const Rect& anchor, const Viewport& viewport) {
    return overlay.width <= viewport.width - anchor.right;
}

Side resolveSide(const Rect& overlay, const Rect& anchor,
                 const Viewport& viewport, Side preferred) {
    Side resolved = Side::Top;
    switch (preferred) {
        case Side::Top:
            resolved = !fitsTop(overlay, anchor) && fitsBottom(overlay, anchor, viewport)
                ? Side::Bottom : Side::Top;
            break;
        case Side::Bottom:
            resolved = !fitsBottom(overlay, anchor, viewport) && fitsTop(overlay, anchor)
                ? Side::Top : Side::Bottom;
            break;
        case Side::Left:
            resolved = !fitsLeft(overlay, anchor) && fitsRight(overlay, anchor, viewport)
                ? Side::Right : Side::Left;
            break;
        case Side::Right:
            resolved = !fitsRight(overlay, anchor, viewport) && fitsLeft(overlay, anchor)
                ? Side::Left : Side::Right;
            break;
        default:
            // Out-of-range value smuggled in through a cast
            resolved = Side::Top;
            break;
    }

    if (resolved != preferred) {
        ytrace("resolveSide: flipped {} -> {} (overlay {}x{}, anchor t={} b={} l={} r={}, viewport {}x{})",
               sideName(preferred), sideName(resolved), overlay.width, overlay.height,
               anchor.top, anchor.bottom, anchor.left, anchor.right,
               viewport.width, viewport.height);
    }
    return resolved;
}

Side resolveSide(const Rect& overlay, const Rect& anchor,
                 const Viewport& viewport, std::string_view preferred) {
    // No fit check at all for names we don't know
    if (!isSideName(preferred)) return Side::Top;
    return resolveSide(overlay, anchor, viewport, parseSide(preferred));
}

Placement resolvePlacement(const Rect& overlay, const Rect& anchor,
                           const Viewport& viewport, const Placement& preferred) {
    return Placement{resolveSide(overlay, anchor, viewport, preferred.side), preferred.align};
}

} // namespace yoverlay
