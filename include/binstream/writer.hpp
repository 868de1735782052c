#pragma once

#include "bytes.hpp"
#include "result.hpp"
#include "types.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <string>

namespace binstream {

    // Writes primitive values in little-endian binary, plus 7-bit encoded
    // integers and length-prefixed UTF-8 strings, to a seekable stream it owns.
    class BufferWriter {
    public:
        // Owns a fresh in-memory stream.
        BufferWriter();
        explicit BufferWriter(std::unique_ptr<std::iostream> stream);

        BufferWriter(BufferWriter&&) noexcept = default;
        BufferWriter& operator=(BufferWriter&&) noexcept = default;

        Result<uint64_t> position();
        Result<uint64_t> len();
        Result<uint64_t> seek(int64_t offset, SeekOrigin origin);

        // Whole stream from offset 0, wherever the cursor is. Leaves the
        // cursor at the end.
        Result<Bytes> to_vec();

        Result<uint64_t> write_u8(uint8_t value);
        Result<uint64_t> write_u16(uint16_t value);
        Result<uint64_t> write_u32(uint32_t value);
        Result<uint64_t> write_u64(uint64_t value);
        Result<uint64_t> write_i16(int16_t value);
        Result<uint64_t> write_i32(int32_t value);
        Result<uint64_t> write_i64(int64_t value);
        Result<uint64_t> write_f32(float value);
        Result<uint64_t> write_f64(double value);

        // 7 bits per byte, low group first, high bit set on every byte but
        // the last. The bit pattern is encoded unsigned, so negative values
        // always take 5 bytes.
        Result<uint64_t> write_7bit_int(int32_t value);

        // 7-bit encoded byte length, then the UTF-8 bytes. Returns the total
        // bytes written.
        Result<uint64_t> write_string(const std::string& value);

        // Verbatim, no length prefix.
        Result<uint64_t> write_bytes(const Bytes& value);

        std::iostream& stream();
        std::unique_ptr<std::iostream> release();

    private:
        Result<uint64_t> write_raw(const uint8_t* data, size_t size);

        std::unique_ptr<std::iostream> stream_;
    };

}  // namespace binstream
