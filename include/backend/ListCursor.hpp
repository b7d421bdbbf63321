#pragma once

#include "model/PlaybackState.hpp"
#include <cstddef>

namespace cadence::backend {

/// Wrap-around selection and scroll-follow arithmetic shared by the track
/// list and the playlist list.
struct ListCursor {
    /// Neighbour of index in a list of len items, wrapping at both ends.
    /// len must be non-zero.
    static size_t step(size_t index, size_t len, model::Direction dir);

    /// Smallest change to offset that keeps index inside a viewport of
    /// capacity rows, clamped to [0, max(0, len - capacity)].
    static size_t follow(size_t index, size_t offset, size_t len, size_t capacity);

    static size_t clamp_offset(size_t offset, size_t len, size_t capacity);
};

}  // namespace cadence::backend
