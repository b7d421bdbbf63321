#include "backend/ListCursor.hpp"

#include <algorithm>

namespace cadence::backend {

size_t ListCursor::step(size_t index, size_t len, model::Direction dir) {
    if (len == 0) return 0;
    index = std::min(index, len - 1);

    if (dir == model::Direction::Next) {
        return index + 1 < len ? index + 1 : 0;
    }
    return index > 0 ? index - 1 : len - 1;
}

size_t ListCursor::follow(size_t index, size_t offset, size_t len, size_t capacity) {
    capacity = std::max<size_t>(capacity, 1);

    if (index < offset) {
        offset = index;
    } else if (index >= offset + capacity) {
        offset = index + 1 - capacity;
    }
    return clamp_offset(offset, len, capacity);
}

size_t ListCursor::clamp_offset(size_t offset, size_t len, size_t capacity) {
    capacity = std::max<size_t>(capacity, 1);
    size_t max_offset = len > capacity ? len - capacity : 0;
    return std::min(offset, max_offset);
}

}  // namespace cadence::backend
