#pragma once

#include <map>
#include <string>

#include "execution/spec_runner.hpp"

namespace cardpipe {

// Keeps written files in memory. Reads see earlier writes first and fall back
// to `backing` (when given) for files this instance never wrote. Writes drop
// blank records, as a round trip through a text file does.
class MemoryRecordIo final : public RecordIo {
  public:
    explicit MemoryRecordIo(RecordIo *backing = nullptr);

    std::expected<Records, Error> read(const FileEndpoint &endpoint) override;
    std::expected<void, Error> write(const FileEndpoint &endpoint, const Records &records) override;

    void put(const std::string &path, Records records);
    [[nodiscard]] const std::map<std::string, Records> &files() const noexcept { return files_; }

  private:
    RecordIo *backing_;
    std::map<std::string, Records> files_;
};

} // namespace cardpipe
