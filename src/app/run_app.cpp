#include "app/run_app.hpp"

#include <format>
#include <iostream>
#include <optional>
#include <utility>

#include "io/memory_record_io.hpp"

namespace cardpipe {

RunApp::RunApp(CliOptions options) : options_(std::move(options)), io_() {}

int RunApp::run() {
    auto spec = load_spec(options_.pipeline_path);
    if (!spec.has_value()) {
        std::cerr << describe(spec.error()) << std::endl;
        return 1;
    }

    auto input = load_input(options_.input_path);
    if (!input.has_value()) {
        std::cerr << describe(input.error()) << std::endl;
        return 1;
    }

    std::optional<Records> rehearsal;
    if (options_.verify) {
        auto rehearsed = rehearse(*spec, *input);
        if (!rehearsed.has_value()) {
            std::cerr << describe(rehearsed.error()) << std::endl;
            return 1;
        }
        rehearsal = std::move(*rehearsed);
    }

    auto result = SpecRunner(io_).run(*spec, *input, options_.mode);
    if (!result.has_value()) {
        std::cerr << describe(result.error()) << std::endl;
        return 1;
    }

    if (rehearsal.has_value()) {
        if (*rehearsal != result->output) {
            std::cerr << std::format(
                             "verify: executors disagree ({} records vs {} from the other executor)",
                             result->output.size(),
                             rehearsal->size())
                      << std::endl;
            return 1;
        }
        std::cerr << "verify: batch and record-at-a-time outputs match" << std::endl;
    }

    report(*result);

    auto written = options_.output_path.has_value() ? write_output(*options_.output_path, result->output)
                                                    : write_records(std::cout, result->output);
    if (!written.has_value()) {
        std::cerr << describe(written.error()) << std::endl;
        return 1;
    }

    return 0;
}

// Runs every pipeline with the other executor first. File sinks are kept in
// memory so the real run starts from the same files.
std::expected<Records, Error> RunApp::rehearse(const PipelineSpec &spec, const Records &input) {
    const ExecutionMode other =
        options_.mode == ExecutionMode::Batch ? ExecutionMode::RecordAtATime : ExecutionMode::Batch;

    MemoryRecordIo dry_run(&io_);
    auto result = SpecRunner(dry_run).run(spec, input, other);
    if (!result.has_value()) {
        return std::unexpected(result.error());
    }

    return std::move(result->output);
}

std::expected<void, Error> RunApp::write_output(const std::string &path, const Records &records) {
    if (auto prepared = ensure_parent_directory(path); !prepared.has_value()) {
        return prepared;
    }

    return FileRecordIo::write_file(path, records, WriteMode::Truncate);
}

void RunApp::report(const RunResult &result) {
    const bool several = result.reports.size() > 1;

    for (std::size_t index = 0; index < result.reports.size(); ++index) {
        const PipelineReport &counts = result.reports[index];
        if (several) {
            std::cerr << std::format("pipeline {}: ", index + 1);
        }
        std::cerr << std::format("Processed {} -> {} records", counts.input_count, counts.output_count) << std::endl;
    }
}

} // namespace cardpipe
