#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace cardpipe {

enum class ErrorKind {
    Parse,
    RecordFormat,
    FieldRange,
    Io,
    Usage,
};

// Every fallible operation reports through std::expected<T, Error>.
// line is 1-based (DSL line or input line), 0 when not applicable.
// context names the stage keyword, file path or input source involved.
struct Error {
    ErrorKind kind;
    std::string message;
    std::size_t line{0};
    std::string context;
};

[[nodiscard]] std::string_view kind_name(ErrorKind kind) noexcept;
[[nodiscard]] std::string describe(const Error &error);

[[nodiscard]] Error parse_error(std::size_t line, std::string message);
[[nodiscard]] Error field_range_error(std::size_t offset, std::size_t length);
[[nodiscard]] Error io_error(std::string path, std::string message);
[[nodiscard]] Error usage_error(std::string message);

} // namespace cardpipe
