#pragma once

#include "geometry.h"

namespace yoverlay {

//=============================================================================
// Position resolver — picks the side of the anchor an overlay renders on
//
// Flip-to-opposite only: when the preferred side cannot hold the overlay but
// the opposite side can, the opposite side wins. Otherwise the preferred side
// is kept, even if the overlay then overflows the viewport. There is no
// perpendicular fallback and no clamping.
//
// Pure functions; safe to call on every open, resize and scroll.
//=============================================================================

bool fitsTop(const Rect& overlay, const Rect& anchor);
bool fitsBottom(const Rect& overlay, const Rect& anchor, const Viewport& viewport);
bool fitsLeft(const Rect& overlay, const Rect& anchor);
bool fitsRight(const Rect& overlay, const Rect& anchor, const Viewport& viewport);

Side resolveSide(const Rect& overlay, const Rect& anchor,
                 const Viewport& viewport, Side preferred);

// Host-supplied side name; unrecognised names give Side::Top without a fit check
Side resolveSide(const Rect& overlay, const Rect& anchor,
                 const Viewport& viewport, std::string_view preferred);

// Flips the side only, alignment is carried through
Placement resolvePlacement(const Rect& overlay, const Rect& anchor,
                           const Viewport& viewport, const Placement& preferred);

} // namespace yoverlay
