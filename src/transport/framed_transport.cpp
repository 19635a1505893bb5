#include "transport/framed_transport.hpp"

#include <charconv>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>

namespace budget::transport {

using core::errors::BudgetError;
using core::errors::ErrorCategory;

namespace {

std::string_view trim(std::string_view value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

core::errors::Result<std::size_t> parse_content_length(const std::string& header_line,
                                                       const std::size_t max_body_bytes) {
    if (header_line.rfind(kContentLengthPrefix.data(), 0, kContentLengthPrefix.size()) != 0) {
        return BudgetError{ErrorCategory::Framing, "Expected Content-Length header",
                           "missing_content_length"};
    }

    const std::string_view value =
        trim(std::string_view(header_line).substr(kContentLengthPrefix.size()));
    std::uint64_t length = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, length);
    if (value.empty() || ec != std::errc() || ptr != end) {
        return BudgetError{ErrorCategory::Framing,
                           "Invalid Content-Length value: " + std::string(value),
                           "invalid_content_length"};
    }
    if (length > max_body_bytes) {
        return BudgetError{ErrorCategory::Framing,
                           "Content-Length " + std::to_string(length) +
                               " exceeds limit of " + std::to_string(max_body_bytes),
                           "content_length_too_large"};
    }
    return static_cast<std::size_t>(length);
}

}  // namespace

bool is_valid_utf8(std::string_view bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t extra = 0;
        std::uint32_t code_point = 0;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= bytes.size()) {
            return false;
        }

        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(bytes[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        // Overlong forms, UTF-16 surrogates and values past U+10FFFF.
        constexpr std::uint32_t kMinByLength[] = {0, 0x80, 0x800, 0x10000};
        if (code_point < kMinByLength[extra] ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) || code_point > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

core::errors::Result<std::optional<std::string>> read_message(
    std::istream& in, const std::size_t max_body_bytes) {
    if (in.peek() == std::char_traits<char>::eof()) {
        if (in.bad()) {
            return BudgetError{ErrorCategory::Io, "Input stream failure before header",
                               "read_failed"};
        }
        return std::optional<std::string>{};
    }

    std::string header_line;
    std::getline(in, header_line);
    if (in.bad()) {
        return BudgetError{ErrorCategory::Io, "Input stream failure reading header",
                           "read_failed"};
    }

    auto length_result = parse_content_length(header_line, max_body_bytes);
    if (core::errors::is_error(length_result)) {
        return core::errors::get_error(length_result);
    }
    const std::size_t content_length = core::errors::get_value(length_result);

    // Separator line: consumed, content not validated.
    std::string separator;
    if (!std::getline(in, separator)) {
        if (in.bad()) {
            return BudgetError{ErrorCategory::Io, "Input stream failure reading separator",
                               "read_failed"};
        }
        return BudgetError{ErrorCategory::Truncated,
                           "Stream ended before header separator", "truncated_frame"};
    }

    std::string body(content_length, '\0');
    if (content_length > 0) {
        in.read(&body[0], static_cast<std::streamsize>(content_length));
        const auto received = static_cast<std::size_t>(in.gcount());
        if (in.bad()) {
            return BudgetError{ErrorCategory::Io, "Input stream failure reading body",
                               "read_failed"};
        }
        if (received < content_length) {
            return BudgetError{ErrorCategory::Truncated,
                               "Stream ended after " + std::to_string(received) + " of " +
                                   std::to_string(content_length) + " body bytes",
                               "truncated_frame"};
        }
    }

    if (!is_valid_utf8(body)) {
        return BudgetError{ErrorCategory::Encoding, "Message content is not valid UTF-8",
                           "invalid_utf8"};
    }
    return std::optional<std::string>{std::move(body)};
}

core::errors::Result<std::size_t> write_message(std::ostream& out, const std::string& body) {
    const std::string header =
        std::string(kContentLengthPrefix) + " " + std::to_string(body.size()) + "\r\n\r\n";
    out.write(header.data(), static_cast<std::streamsize>(header.size()));
    out.write(body.data(), static_cast<std::streamsize>(body.size()));
    out.flush();
    if (!out.good()) {
        return BudgetError{ErrorCategory::Io, "Failed to write framed message",
                           "write_failed"};
    }
    return header.size() + body.size();
}

}  // namespace budget::transport
