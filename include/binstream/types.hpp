#pragma once

#include <cstdint>
#include <ios>

namespace binstream {

    // Reference point for a signed seek offset.
    enum class SeekOrigin : uint8_t {
        Begin,
        Current,
        End,
    };

    // Byte order of a multi-byte value. Every fixed-width codec in this
    // library is Little.
    enum class Endianness : uint8_t {
        Little,
        Big,
    };

    inline constexpr Endianness kWireEndianness = Endianness::Little;

    inline std::ios_base::seekdir to_seekdir(SeekOrigin origin) {
        switch (origin) {
        case SeekOrigin::Begin:
            return std::ios_base::beg;
        case SeekOrigin::Current:
            return std::ios_base::cur;
        case SeekOrigin::End:
            return std::ios_base::end;
        }
        return std::ios_base::beg;
    }

}  // namespace binstream
