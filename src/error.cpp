#include "binstream/error.hpp"

namespace binstream {

    std::string describe(const BufferError& error) {
        if (auto e = std::get_if<IndexOutOfRange>(&error)) {
            return "Index out of range: " + std::to_string(e->index);
        }
        if (std::holds_alternative<EndOfStream>(error)) {
            return "End of stream";
        }
        if (auto e = std::get_if<ReadFailure>(&error)) {
            return "Read failure: " + e->error.message();
        }
        return "I/O failure";
    }

    std::ostream& operator<<(std::ostream& os, const BufferError& error) {
        return os << describe(error);
    }

}  // namespace binstream
