#include "binstream/io.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <system_error>

namespace binstream {

    static std::filesystem::path unique_temp_path() {
        static std::atomic<uint64_t> counter{ 0 };
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        std::string name = "binstream-" + std::to_string(stamp) + "-" +
            std::to_string(counter.fetch_add(1)) + ".bin";
        return std::filesystem::temp_directory_path() / name;
    }

    TempFile::TempFile() : path_(unique_temp_path()) {
        std::ofstream create(path_, std::ios::binary | std::ios::trunc);
        if (!create) {
            throw std::runtime_error("Failed to create temp file: " + path_.string());
        }
    }

    TempFile::~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& TempFile::path() const { return path_; }

    std::unique_ptr<std::fstream> TempFile::open() const {
        auto f = std::make_unique<std::fstream>(
            path_, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
        if (!f->is_open()) {
            throw std::runtime_error("Failed to open temp file: " + path_.string());
        }
        return f;
    }

    std::unique_ptr<std::stringstream> memory_stream(const Bytes& initial) {
        auto s = std::make_unique<std::stringstream>(
            std::ios::in | std::ios::out | std::ios::binary);
        if (!initial.empty()) {
            s->write(reinterpret_cast<const char*>(initial.data()),
                std::streamsize(initial.size()));
            s->seekp(0, std::ios::beg);
            s->seekg(0, std::ios::beg);
        }
        return s;
    }

}  // namespace binstream
