#include "binstream/writer.hpp"

#include "binstream/io.hpp"
#include "binstream/tools.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

namespace binstream {

    BufferWriter::BufferWriter() : stream_(memory_stream()) {}

    BufferWriter::BufferWriter(std::unique_ptr<std::iostream> stream)
        : stream_(std::move(stream)) {
        if (!stream_) {
            throw std::invalid_argument("BufferWriter requires a stream");
        }
    }

    std::iostream& BufferWriter::stream() {
        if (!stream_) throw std::logic_error("BufferWriter stream was released");
        return *stream_;
    }

    std::unique_ptr<std::iostream> BufferWriter::release() {
        return std::move(stream_);
    }

    Result<uint64_t> BufferWriter::position() {
        return seek(0, SeekOrigin::Current);
    }

    Result<uint64_t> BufferWriter::len() {
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

    Result<uint64_t> BufferWriter::seek(int64_t offset, SeekOrigin origin) {
        std::iostream& s = stream();
        s.clear();
        s.seekp(std::streamoff(offset), to_seekdir(origin));
        if (s.fail()) {
            s.clear();
            return tl::make_unexpected(IndexOutOfRange{ offset });
        }

        std::streampos pos = s.tellp();
        if (pos == std::streampos(-1)) {
            s.clear();
            return tl::make_unexpected(IndexOutOfRange{ offset });
        }
        return uint64_t(std::streamoff(pos));
    }

    Result<Bytes> BufferWriter::to_vec() {
        auto length = len();
        if (!length) return tl::make_unexpected(length.error());

        std::iostream& s = stream();
        s.clear();
        s.seekg(0, std::ios::beg);
        if (s.fail()) {
            s.clear();
            return tl::make_unexpected(IndexOutOfRange{ 0 });
        }

        Bytes out(size_t(length.value()));
        if (!out.empty()) {
            s.read(reinterpret_cast<char*>(out.data()), std::streamsize(out.size()));
            if (uint64_t(s.gcount()) != out.size()) {
                s.clear();
                return tl::make_unexpected(IOFailure{});
            }
        }

        auto end = seek(0, SeekOrigin::End);
        if (!end) return tl::make_unexpected(end.error());
        return out;
    }

    Result<uint64_t> BufferWriter::write_raw(const uint8_t* data, size_t size) {
        std::iostream& s = stream();
        if (size == 0) return uint64_t(0);

        s.write(reinterpret_cast<const char*>(data), std::streamsize(size));
        if (!s) {
            s.clear();
            return tl::make_unexpected(IOFailure{});
        }
        return uint64_t(size);
    }

    Result<uint64_t> BufferWriter::write_u8(uint8_t value) {
        return write_raw(&value, 1);
    }

    Result<uint64_t> BufferWriter::write_u16(uint16_t value) {
        Bytes data;
        write_le_u16(data, value);
        return write_raw(data.data(), data.size());
    }

    Result<uint64_t> BufferWriter::write_u32(uint32_t value) {
        Bytes data;
        write_le_u32(data, value);
        return write_raw(data.data(), data.size());
    }

    Result<uint64_t> BufferWriter::write_u64(uint64_t value) {
        Bytes data;
        write_le_u64(data, value);
        return write_raw(data.data(), data.size());
    }

    Result<uint64_t> BufferWriter::write_i16(int16_t value) {
        return write_u16(uint16_t(value));
    }

    Result<uint64_t> BufferWriter::write_i32(int32_t value) {
        return write_u32(uint32_t(value));
    }

    Result<uint64_t> BufferWriter::write_i64(int64_t value) {
        return write_u64(uint64_t(value));
    }

    Result<uint64_t> BufferWriter::write_f32(float value) {
        Bytes data;
        write_le_f32(data, value);
        return write_raw(data.data(), data.size());
    }

    Result<uint64_t> BufferWriter::write_f64(double value) {
        Bytes data;
        write_le_f64(data, value);
        return write_raw(data.data(), data.size());
    }

    Result<uint64_t> BufferWriter::write_7bit_int(int32_t value) {
        uint32_t v = uint32_t(value);
        uint64_t written = 0;
        while (v >= 0x80) {
            auto r = write_u8(uint8_t(v | 0x80));
            if (!r) return tl::make_unexpected(r.error());
            written += r.value();
            v >>= 7;
        }
        auto r = write_u8(uint8_t(v));
        if (!r) return tl::make_unexpected(r.error());
        return written + r.value();
    }

    Result<uint64_t> BufferWriter::write_string(const std::string& value) {
        if (value.size() > size_t(std::numeric_limits<int32_t>::max()) ||
            !is_valid_utf8(value)) {
            return tl::make_unexpected(IOFailure{});
        }

        auto prefix = write_7bit_int(int32_t(value.size()));
        if (!prefix) return tl::make_unexpected(prefix.error());

        auto payload = write_raw(reinterpret_cast<const uint8_t*>(value.data()), value.size());
        if (!payload) return tl::make_unexpected(payload.error());
        return prefix.value() + payload.value();
    }

    Result<uint64_t> BufferWriter::write_bytes(const Bytes& value) {
        return write_raw(value.data(), value.size());
    }

}  // namespace binstream
