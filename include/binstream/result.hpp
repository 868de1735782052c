#pragma once

#include "error.hpp"

#include <variant>

#include <tl/expected.hpp>

namespace binstream {

    // Either a decoded/encoded value or the BufferError that stopped it.
    template <typename T>
    using Result = tl::expected<T, BufferError>;

    // True when r failed with error kind E.
    template <typename E, typename T>
    bool failed_with(const Result<T>& r) {
        return !r.has_value() && std::holds_alternative<E>(r.error());
    }

}  // namespace binstream
