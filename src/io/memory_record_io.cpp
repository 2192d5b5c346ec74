#include "io/memory_record_io.hpp"

#include <utility>

#include "io/record_file.hpp"

namespace cardpipe {

MemoryRecordIo::MemoryRecordIo(RecordIo *backing) : backing_(backing) {}

std::expected<Records, Error> MemoryRecordIo::read(const FileEndpoint &endpoint) {
    if (auto it = files_.find(endpoint.path); it != files_.end()) {
        return it->second;
    }

    if (backing_ != nullptr) {
        return backing_->read(endpoint);
    }

    return std::unexpected(io_error(endpoint.path, "no such file"));
}

std::expected<void, Error> MemoryRecordIo::write(const FileEndpoint &endpoint, const Records &records) {
    auto it = files_.find(endpoint.path);

    if (it == files_.end() || endpoint.mode == WriteMode::Truncate) {
        Records initial;
        // Appending to a file that cannot be read yet creates it.
        if (endpoint.mode == WriteMode::Append && backing_ != nullptr) {
            if (auto existing = backing_->read(endpoint); existing.has_value()) {
                initial = std::move(*existing);
            }
        }
        it = files_.insert_or_assign(endpoint.path, std::move(initial)).first;
    }

    // Stored the way a file would read back, so runs over memory and disk agree.
    const Records stored = as_stored(records);
    it->second.insert(it->second.end(), stored.begin(), stored.end());
    return {};
}

void MemoryRecordIo::put(const std::string &path, Records records) { files_[path] = std::move(records); }

} // namespace cardpipe
