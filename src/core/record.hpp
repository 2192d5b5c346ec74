#pragma once

#include <array>
#include <cstddef>
#include <expected>
#include <string_view>
#include <vector>

#include "core/error.hpp"

namespace cardpipe {

inline constexpr std::size_t record_width = 80;

// A fixed-width 80-byte ASCII record. Every record in the system has exactly
// record_width bytes; shorter text is right-padded with spaces.
class Record {
  public:
    Record() noexcept;

    // Strict constructor for external input: longer than 80 bytes or any
    // non-ASCII byte is a RecordFormat error.
    [[nodiscard]] static std::expected<Record, Error> from_line(std::string_view line);

    // Pads or truncates text that is already known to be ASCII.
    [[nodiscard]] static Record padded(std::string_view text) noexcept;

    [[nodiscard]] std::string_view text() const noexcept;
    [[nodiscard]] std::string_view trimmed() const noexcept;
    [[nodiscard]] bool is_blank() const noexcept;

    [[nodiscard]] std::expected<std::string_view, Error> field(std::size_t offset, std::size_t length) const;

    // Replaces [offset, offset + length) with value, truncated or space-padded.
    [[nodiscard]] std::expected<void, Error> set_field(std::size_t offset, std::size_t length, std::string_view value);

    bool operator==(const Record &other) const = default;

  private:
    std::array<char, record_width> data_;
};

using Records = std::vector<Record>;

[[nodiscard]] std::expected<void, Error> check_field_range(std::size_t offset, std::size_t length);

} // namespace cardpipe
