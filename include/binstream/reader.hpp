#pragma once

#include "bytes.hpp"
#include "result.hpp"
#include "types.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <string>

namespace binstream {

    // Reads little-endian primitives, 7-bit encoded integers and
    // length-prefixed UTF-8 strings from a seekable stream it owns.
    //
    // Every fixed-size or counted read checks position + size <= len() first
    // and fails with EndOfStream without consuming anything.
    class BufferReader {
    public:
        // Owns an in-memory stream over a copy of data.
        explicit BufferReader(const Bytes& data);
        explicit BufferReader(std::unique_ptr<std::istream> stream);

        BufferReader(BufferReader&&) noexcept = default;
        BufferReader& operator=(BufferReader&&) noexcept = default;

        Result<uint64_t> position();
        Result<uint64_t> len();
        Result<uint64_t> seek(int64_t offset, SeekOrigin origin);
        Result<uint64_t> remaining();

        Result<uint8_t> read_u8();
        Result<uint16_t> read_u16();
        Result<uint32_t> read_u32();
        Result<uint64_t> read_u64();
        Result<int16_t> read_i16();
        Result<int32_t> read_i32();
        Result<int64_t> read_i64();
        Result<float> read_f32();
        Result<double> read_f64();

        // At most 5 bytes; a 6th continuation byte is IOFailure.
        Result<int32_t> read_7bit_int();

        Result<std::string> read_string();

        Result<Bytes> read_bytes(uint64_t count);

        // Reads count bytes at offset and restores the cursor afterwards.
        Result<Bytes> read_bytes_at(uint64_t offset, uint64_t count);

        std::istream& stream();
        std::unique_ptr<std::istream> release();

    private:
        Result<bool> has_remaining(uint64_t count);

        std::unique_ptr<std::istream> stream_;
    };

}  // namespace binstream
