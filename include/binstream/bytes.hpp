#pragma once

#include "types.hpp"

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace binstream {

    using Bytes = std::vector<uint8_t>;

    static_assert(kWireEndianness == Endianness::Little,
        "read_le_*/write_le_* define the wire byte order");

    inline void require_size(const Bytes& b, size_t off, size_t n) {
        if (off + n > b.size()) {
            throw std::runtime_error("Buffer underrun");
        }
    }

    inline uint16_t read_le_u16(const Bytes& b, size_t off) {
        require_size(b, off, 2);
        return uint16_t(b[off]) | (uint16_t(b[off + 1]) << 8);
    }

    inline int16_t read_le_i16(const Bytes& b, size_t off) {
        return int16_t(read_le_u16(b, off));
    }

    inline uint32_t read_le_u32(const Bytes& b, size_t off) {
        require_size(b, off, 4);
        return uint32_t(b[off]) | (uint32_t(b[off + 1]) << 8) |
            (uint32_t(b[off + 2]) << 16) | (uint32_t(b[off + 3]) << 24);
    }

    inline int32_t read_le_i32(const Bytes& b, size_t off) {
        return int32_t(read_le_u32(b, off));
    }

    // Two little-endian 32-bit halves, low half first.
    inline uint64_t read_le_u64(const Bytes& b, size_t off) {
        require_size(b, off, 8);
        uint64_t lo = read_le_u32(b, off);
        uint64_t hi = read_le_u32(b, off + 4);
        return (hi << 32) | lo;
    }

    inline int64_t read_le_i64(const Bytes& b, size_t off) {
        return int64_t(read_le_u64(b, off));
    }

    inline float read_le_f32(const Bytes& b, size_t off) {
        uint32_t u = read_le_u32(b, off);
        float f;
        static_assert(sizeof(float) == 4);
        std::memcpy(&f, &u, 4);
        return f;
    }

    inline double read_le_f64(const Bytes& b, size_t off) {
        uint64_t u = read_le_u64(b, off);
        double d;
        static_assert(sizeof(double) == 8);
        std::memcpy(&d, &u, 8);
        return d;
    }

    inline void write_le_u16(Bytes& out, uint16_t v) {
        out.push_back(uint8_t(v & 0xFF));
        out.push_back(uint8_t((v >> 8) & 0xFF));
    }

    inline void write_le_u32(Bytes& out, uint32_t v) {
        out.push_back(uint8_t(v & 0xFF));
        out.push_back(uint8_t((v >> 8) & 0xFF));
        out.push_back(uint8_t((v >> 16) & 0xFF));
        out.push_back(uint8_t((v >> 24) & 0xFF));
    }

    inline void write_le_u64(Bytes& out, uint64_t v) {
        for (int i = 0; i < 8; i++) {
            out.push_back(uint8_t((v >> (i * 8)) & 0xFF));
        }
    }

    inline void write_le_f32(Bytes& out, float f) {
        uint32_t u;
        std::memcpy(&u, &f, 4);
        write_le_u32(out, u);
    }

    inline void write_le_f64(Bytes& out, double d) {
        uint64_t u;
        std::memcpy(&u, &d, 8);
        write_le_u64(out, u);
    }

}  // namespace binstream
