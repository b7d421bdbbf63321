#include "util/TimSort.hpp"

namespace cadence::util {

size_t min_run_length(size_t n) {
    size_t carry = 0;
    while (n >= 32) {
        carry |= (n & 1);
        n >>= 1;
    }
    return n + carry;
}

}  // namespace cadence::util
