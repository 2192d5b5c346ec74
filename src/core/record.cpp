#include "core/record.hpp"

#include <algorithm>
#include <format>

namespace cardpipe {

Record::Record() noexcept { data_.fill(' '); }

std::expected<Record, Error> Record::from_line(std::string_view line) {
    if (line.size() > record_width) {
        return std::unexpected(Error{
            .kind = ErrorKind::RecordFormat,
            .message = std::format("record is {} bytes, limit is {}", line.size(), record_width),
            .line = 0,
            .context = {}});
    }

    const auto non_ascii = std::ranges::find_if(line, [](char c) { return static_cast<unsigned char>(c) > 0x7f; });
    if (non_ascii != line.end()) {
        return std::unexpected(Error{
            .kind = ErrorKind::RecordFormat,
            .message = std::format("non-ASCII byte at column {}", non_ascii - line.begin()),
            .line = 0,
            .context = {}});
    }

    return padded(line);
}

Record Record::padded(std::string_view text) noexcept {
    Record record;
    const std::size_t count = std::min(text.size(), record_width);
    std::copy_n(text.begin(), count, record.data_.begin());
    return record;
}

std::string_view Record::text() const noexcept { return {data_.data(), data_.size()}; }

std::string_view Record::trimmed() const noexcept {
    const std::string_view all = text();
    const auto last = all.find_last_not_of(' ');
    if (last == std::string_view::npos) {
        return {};
    }

    return all.substr(0, last + 1);
}

bool Record::is_blank() const noexcept {
    return std::ranges::all_of(data_, [](char c) { return c == ' '; });
}

std::expected<std::string_view, Error> Record::field(std::size_t offset, std::size_t length) const {
    if (auto valid = check_field_range(offset, length); !valid.has_value()) {
        return std::unexpected(valid.error());
    }

    return text().substr(offset, length);
}

std::expected<void, Error> Record::set_field(std::size_t offset, std::size_t length, std::string_view value) {
    if (auto valid = check_field_range(offset, length); !valid.has_value()) {
        return valid;
    }

    const auto destination = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    std::fill_n(destination, length, ' ');
    std::copy_n(value.begin(), std::min(value.size(), length), destination);
    return {};
}

std::expected<void, Error> check_field_range(std::size_t offset, std::size_t length) {
    if (length == 0 || offset >= record_width || length > record_width - offset) {
        return std::unexpected(field_range_error(offset, length));
    }

    return {};
}

} // namespace cardpipe
