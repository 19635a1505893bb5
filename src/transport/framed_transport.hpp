#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include "core/errors/budget_errors.hpp"

namespace budget::transport {

inline constexpr std::string_view kContentLengthPrefix = "Content-Length:";
inline constexpr std::size_t kDefaultMaxBodyBytes = 64 * 1024 * 1024;

// Reads one `Content-Length: N\r\n\r\n<N bytes>` frame.
// Returns std::nullopt on end-of-stream before any header byte.
core::errors::Result<std::optional<std::string>> read_message(
    std::istream& in, std::size_t max_body_bytes = kDefaultMaxBodyBytes);

// Writes one frame and flushes. Returns the number of bytes written.
core::errors::Result<std::size_t> write_message(std::ostream& out,
                                                const std::string& body);

bool is_valid_utf8(std::string_view bytes);

}  // namespace budget::transport
