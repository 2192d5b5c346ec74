#include "io/record_file.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <ios>
#include <istream>
#include <ostream>
#include <string_view>
#include <system_error>
#include <utility>

namespace cardpipe {

std::expected<Records, Error> read_records(std::istream &in, const std::string &name) {
    Records records;
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        auto record = Record::from_line(line);
        if (!record.has_value()) {
            Error error = std::move(record.error());
            error.line = line_number;
            error.context = name;
            return std::unexpected(std::move(error));
        }

        records.push_back(*record);
    }

    if (in.bad()) {
        return std::unexpected(io_error(name, "read failed"));
    }

    return records;
}

std::expected<void, Error> write_records(std::ostream &out, const Records &records) {
    for (const auto &record : records) {
        out << record.trimmed() << '\n';
    }

    if (!out) {
        return std::unexpected(io_error("<output>", "write failed"));
    }

    return {};
}

Records as_stored(const Records &records) {
    Records stored;
    stored.reserve(records.size());

    for (const auto &record : records) {
        if (!record.is_blank()) {
            stored.push_back(record);
        }
    }

    return stored;
}

std::expected<void, Error> ensure_parent_directory(const std::string &path) {
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) {
        return {};
    }

    std::error_code error;
    std::filesystem::create_directories(parent, error);
    if (error) {
        return std::unexpected(io_error(path, std::format("cannot create directory: {}", error.message())));
    }

    return {};
}

std::expected<Records, Error> FileRecordIo::read(const FileEndpoint &endpoint) { return read_file(endpoint.path); }

std::expected<void, Error> FileRecordIo::write(const FileEndpoint &endpoint, const Records &records) {
    return write_file(endpoint.path, records, endpoint.mode);
}

std::expected<Records, Error> FileRecordIo::read_file(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(io_error(path, "cannot open for reading"));
    }

    return read_records(file, path);
}

std::expected<void, Error> FileRecordIo::write_file(const std::string &path, const Records &records, WriteMode mode) {
    const auto open_mode = mode == WriteMode::Append ? std::ios::app : std::ios::trunc;

    std::ofstream file(path, std::ios::out | open_mode);
    if (!file.is_open()) {
        return std::unexpected(io_error(path, "cannot open for writing"));
    }

    if (auto written = write_records(file, records); !written.has_value()) {
        return std::unexpected(io_error(path, "write failed"));
    }

    return {};
}

} // namespace cardpipe
