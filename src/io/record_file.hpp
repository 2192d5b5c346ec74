#pragma once

#include <expected>
#include <iosfwd>
#include <string>

#include "core/command.hpp"
#include "core/error.hpp"
#include "core/record.hpp"
#include "execution/spec_runner.hpp"

namespace cardpipe {

// One record per line. Trailing '\r' is dropped and empty lines are skipped;
// `name` is used in RecordFormat errors.
[[nodiscard]] std::expected<Records, Error> read_records(std::istream &in, const std::string &name);

// Each record's text without trailing blanks, one per line.
[[nodiscard]] std::expected<void, Error> write_records(std::ostream &out, const Records &records);

// The records a file written with `write_records` reads back as. A blank
// record is written as an empty line, which reading skips.
[[nodiscard]] Records as_stored(const Records &records);

// Creates the directories leading up to `path` when they are missing.
[[nodiscard]] std::expected<void, Error> ensure_parent_directory(const std::string &path);

class FileRecordIo final : public RecordIo {
  public:
    std::expected<Records, Error> read(const FileEndpoint &endpoint) override;
    std::expected<void, Error> write(const FileEndpoint &endpoint, const Records &records) override;

    [[nodiscard]] static std::expected<Records, Error> read_file(const std::string &path);
    [[nodiscard]] static std::expected<void, Error> write_file(
        const std::string &path, const Records &records, WriteMode mode);
};

} // namespace cardpipe
