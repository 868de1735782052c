#pragma once

#include "bytes.hpp"

#include <cstdint>
#include <string>

namespace binstream {

	// Well-formed UTF-8: no overlong forms, surrogates or truncated sequences.
	bool is_valid_utf8(const uint8_t* data, size_t size);

	inline bool is_valid_utf8(const Bytes& data) {
		return is_valid_utf8(data.data(), data.size());
	}

	inline bool is_valid_utf8(const std::string& s) {
		return is_valid_utf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
	}

}  // namespace binstream
