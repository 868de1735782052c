#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <system_error>
#include <variant>

namespace binstream {

    // A seek the underlying medium refused. Carries the requested offset.
    struct IndexOutOfRange {
        int64_t index = 0;
    };

    inline bool operator==(const IndexOutOfRange& a, const IndexOutOfRange& b) {
        return a.index == b.index;
    }

    // Fewer bytes remain than the read needs. Raised before any byte is
    // consumed.
    struct EndOfStream {};

    inline bool operator==(const EndOfStream&, const EndOfStream&) { return true; }

    // The medium's read primitive failed although enough bytes were declared.
    struct ReadFailure {
        std::error_code error;
    };

    inline bool operator==(const ReadFailure& a, const ReadFailure& b) {
        return a.error == b.error;
    }

    // Write failure, malformed 7-bit integer, negative string length or
    // invalid UTF-8.
    struct IOFailure {};

    inline bool operator==(const IOFailure&, const IOFailure&) { return true; }

    using BufferError = std::variant<IndexOutOfRange, EndOfStream, ReadFailure, IOFailure>;

    std::string describe(const BufferError& error);

    std::ostream& operator<<(std::ostream& os, const BufferError& error);

}  // namespace binstream
