#pragma once
#include "bytes.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace binstream {

    // Scratch file in the system temp directory, removed on destruction.
    class TempFile {
    public:
        TempFile();
        ~TempFile();

        TempFile(const TempFile&) = delete;
        TempFile& operator=(const TempFile&) = delete;

        const std::filesystem::path& path() const;

        // Opens (truncating) the file for binary read/write.
        std::unique_ptr<std::fstream> open() const;

    private:
        std::filesystem::path path_;
    };

    // Binary in-memory read/write stream positioned at offset 0.
    std::unique_ptr<std::stringstream> memory_stream(const Bytes& initial = Bytes());

}  // namespace binstream
