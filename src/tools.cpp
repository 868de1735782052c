#include "binstream/tools.hpp"

#include <limits>

#include <unicode/utf8.h>

namespace binstream {

    bool is_valid_utf8(const uint8_t* data, size_t size) {
        // Lengths on the wire are non-negative int32.
        if (size > size_t(std::numeric_limits<int32_t>::max())) {
            return false;
        }

        const int32_t length = int32_t(size);
        int32_t i = 0;
        while (i < length) {
            UChar32 c;
            U8_NEXT(data, i, length, c);
            if (c < 0) {
                return false;
            }
        }
        return true;
    }

}  // namespace binstream
