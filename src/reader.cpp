#include "binstream/reader.hpp"

#include "binstream/io.hpp"
#include "binstream/tools.hpp"

#include <stdexcept>
#include <utility>

namespace binstream {

    BufferReader::BufferReader(const Bytes& data) : stream_(memory_stream(data)) {}

    BufferReader::BufferReader(std::unique_ptr<std::istream> stream)
        : stream_(std::move(stream)) {
        if (!stream_) {
            throw std::invalid_argument("BufferReader requires a stream");
        }
    }

    std::istream& BufferReader::stream() {
        if (!stream_) throw std::logic_error("BufferReader stream was released");
        return *stream_;
    }

    std::unique_ptr<std::istream> BufferReader::release() {
        return std::move(stream_);
    }

    Result<uint64_t> BufferReader::position() {
        return seek(0, SeekOrigin::Current);
    }

    Result<uint64_t> BufferReader::len() {
        auto old_pos = position();
        if (!old_pos) return tl::make_unexpected(old_pos.error());

        auto end = seek(0, SeekOrigin::End);
        if (!end) return tl::make_unexpected(end.error());

        if (old_pos.value() != end.value()) {
            auto restored = seek(int64_t(old_pos.value()), SeekOrigin::Begin);
            if (!restored) return tl::make_unexpected(restored.error());
        }
        return end.value();
    }

    Result<uint64_t> BufferReader::seek(int64_t offset, SeekOrigin origin) {
        std::istream& s = stream();
        s.clear();
        s.seekg(std::streamoff(offset), to_seekdir(origin));
        if (s.fail()) {
            s.clear();
            return tl::make_unexpected(IndexOutOfRange{ offset });
        }

        std::streampos pos = s.tellg();
        if (pos == std::streampos(-1)) {
            s.clear();
            return tl::make_unexpected(IndexOutOfRange{ offset });
        }
        return uint64_t(std::streamoff(pos));
    }

    Result<uint64_t> BufferReader::remaining() {
        auto pos = position();
        if (!pos) return tl::make_unexpected(pos.error());
        auto length = len();
        if (!length) return tl::make_unexpected(length.error());
        // A file medium lets the cursor sit past the end.
        if (pos.value() >= length.value()) return uint64_t(0);
        return length.value() - pos.value();
    }

    Result<bool> BufferReader::has_remaining(uint64_t count) {
        auto pos = position();
        if (!pos) return tl::make_unexpected(pos.error());
        auto length = len();
        if (!length) return tl::make_unexpected(length.error());
        if (pos.value() > length.value()) return false;
        return count <= length.value() - pos.value();
    }

    Result<Bytes> BufferReader::read_bytes(uint64_t count) {
        auto fits = has_remaining(count);
        if (!fits) return tl::make_unexpected(fits.error());
        if (!fits.value()) return tl::make_unexpected(EndOfStream{});

        Bytes buffer(size_t(count), 0);
        if (count == 0) return buffer;

        std::istream& s = stream();
        s.read(reinterpret_cast<char*>(buffer.data()), std::streamsize(count));
        if (uint64_t(s.gcount()) != count) {
            s.clear();
            return tl::make_unexpected(ReadFailure{ std::make_error_code(std::io_errc::stream) });
        }
        return buffer;
    }

    Result<Bytes> BufferReader::read_bytes_at(uint64_t offset, uint64_t count) {
        auto length = len();
        if (!length) return tl::make_unexpected(length.error());
        if (offset > length.value() || count > length.value() - offset) {
            return tl::make_unexpected(EndOfStream{});
        }

        auto current = position();
        if (!current) return tl::make_unexpected(current.error());

        auto moved = seek(int64_t(offset), SeekOrigin::Begin);
        if (!moved) return tl::make_unexpected(moved.error());

        auto buffer = read_bytes(count);

        auto restored = seek(int64_t(current.value()), SeekOrigin::Begin);
        if (!restored) return tl::make_unexpected(restored.error());
        return buffer;
    }

    Result<uint8_t> BufferReader::read_u8() {
        auto b = read_bytes(1);
        if (!b) return tl::make_unexpected(b.error());
        return b.value()[0];
    }

    Result<uint16_t> BufferReader::read_u16() {
        auto b = read_bytes(2);
        if (!b) return tl::make_unexpected(b.error());
        return read_le_u16(b.value(), 0);
    }

    Result<uint32_t> BufferReader::read_u32() {
        auto b = read_bytes(4);
        if (!b) return tl::make_unexpected(b.error());
        return read_le_u32(b.value(), 0);
    }

    Result<uint64_t> BufferReader::read_u64() {
        auto b = read_bytes(8);
        if (!b) return tl::make_unexpected(b.error());
        return read_le_u64(b.value(), 0);
    }

    Result<int16_t> BufferReader::read_i16() {
        auto b = read_bytes(2);
        if (!b) return tl::make_unexpected(b.error());
        return read_le_i16(b.value(), 0);
    }

    Result<int32_t> BufferReader::read_i32() {
        auto b = read_bytes(4);
        if (!b) return tl::make_unexpected(b.error());
        return read_le_i32(b.value(), 0);
    }

    Result<int64_t> BufferReader::read_i64() {
        auto b = read_bytes(8);
        if (!b) return tl::make_unexpected(b.error());
        return read_le_i64(b.value(), 0);
    }

    Result<float> BufferReader::read_f32() {
        auto b = read_bytes(4);
        if (!b) return tl::make_unexpected(b.error());
        return read_le_f32(b.value(), 0);
    }

    Result<double> BufferReader::read_f64() {
        auto b = read_bytes(8);
        if (!b) return tl::make_unexpected(b.error());
        return read_le_f64(b.value(), 0);
    }

    Result<int32_t> BufferReader::read_7bit_int() {
        uint32_t count = 0;
        int shift = 0;
        uint8_t b = 0;
        do {
            // 5 bytes max per int32.
            if (shift == 5 * 7) {
                return tl::make_unexpected(IOFailure{});
            }
            auto r = read_u8();
            if (!r) return tl::make_unexpected(r.error());
            b = r.value();
            count |= uint32_t(b & 0x7F) << shift;
            shift += 7;
        } while ((b & 0x80) != 0);
        return int32_t(count);
    }

    Result<std::string> BufferReader::read_string() {
        auto length = read_7bit_int();
        if (!length) return tl::make_unexpected(length.error());
        if (length.value() < 0) {
            return tl::make_unexpected(IOFailure{});
        }
        if (length.value() == 0) {
            return std::string();
        }

        auto chars = read_bytes(uint64_t(length.value()));
        if (!chars) return tl::make_unexpected(chars.error());
        if (!is_valid_utf8(chars.value())) {
            return tl::make_unexpected(IOFailure{});
        }
        return std::string(chars.value().begin(), chars.value().end());
    }

}  // namespace binstream
