#include "core/error.hpp"

#include <format>
#include <utility>

#include "core/record.hpp"

namespace cardpipe {

std::string_view kind_name(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Parse:
        return "parse";
    case ErrorKind::RecordFormat:
        return "record format";
    case ErrorKind::FieldRange:
        return "field range";
    case ErrorKind::Io:
        return "i/o";
    case ErrorKind::Usage:
        return "usage";
    }

    return "unknown";
}

std::string describe(const Error &error) {
    std::string text = std::format("{} error: ", kind_name(error.kind));

    if (error.line != 0) {
        text += std::format("line {}: ", error.line);
    }

    text += error.message;

    if (!error.context.empty()) {
        text += std::format(" ({})", error.context);
    }

    return text;
}

Error parse_error(std::size_t line, std::string message) {
    return Error{.kind = ErrorKind::Parse, .message = std::move(message), .line = line, .context = {}};
}

Error field_range_error(std::size_t offset, std::size_t length) {
    return Error{
        .kind = ErrorKind::FieldRange,
        .message = std::format("field {},{} does not fit a {}-byte record", offset, length, record_width),
        .line = 0,
        .context = {}};
}

Error io_error(std::string path, std::string message) {
    return Error{.kind = ErrorKind::Io, .message = std::move(message), .line = 0, .context = std::move(path)};
}

Error usage_error(std::string message) {
    return Error{.kind = ErrorKind::Usage, .message = std::move(message), .line = 0, .context = {}};
}

} // namespace cardpipe
