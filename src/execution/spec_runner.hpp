#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <vector>

#include "core/command.hpp"
#include "core/error.hpp"
#include "core/record.hpp"

namespace cardpipe {

// Resolves file endpoints to record sequences. Console endpoints never reach
// this interface.
class RecordIo {
  public:
    virtual ~RecordIo() = default;

    [[nodiscard]] virtual std::expected<Records, Error> read(const FileEndpoint &endpoint) = 0;
    [[nodiscard]] virtual std::expected<void, Error> write(const FileEndpoint &endpoint, const Records &records) = 0;
};

class ConsoleOnlyIo final : public RecordIo {
  public:
    std::expected<Records, Error> read(const FileEndpoint &endpoint) override;
    std::expected<void, Error> write(const FileEndpoint &endpoint, const Records &records) override;
};

enum class ExecutionMode {
    Batch,
    RecordAtATime,
};

struct PipelineReport {
    std::size_t input_count{0};
    std::size_t output_count{0};
};

struct RunResult {
    Records output;
    std::vector<PipelineReport> reports;
};

[[nodiscard]] std::expected<Records, Error> execute_pipeline(
    const Pipeline &pipeline, Records input, ExecutionMode mode);

// Runs the pipelines of a PipelineSpec in order. A console source takes the
// previous pipeline's console output when there is one, otherwise the primary
// console input; console output nobody consumes ends up in RunResult::output.
class SpecRunner {
  public:
    explicit SpecRunner(RecordIo &io);

    [[nodiscard]] std::expected<RunResult, Error> run(
        const PipelineSpec &spec, const Records &console_input, ExecutionMode mode = ExecutionMode::Batch) const;

    // The records pipeline `index` would receive, produced by running every
    // pipeline before it.
    [[nodiscard]] std::expected<Records, Error> input_for(
        const PipelineSpec &spec, const Records &console_input, std::size_t index) const;

  private:
    RecordIo &io_;

    [[nodiscard]] std::expected<std::optional<Records>, Error> run_prefix(
        const PipelineSpec &spec,
        const Records &console_input,
        std::size_t count,
        ExecutionMode mode,
        RunResult &result) const;
    [[nodiscard]] std::expected<Records, Error> resolve_input(
        const Pipeline &pipeline, std::optional<Records> forwarded, const Records &console_input) const;
};

[[nodiscard]] std::expected<Records, Error> run_batch(Records input, const PipelineSpec &spec);
[[nodiscard]] std::expected<Records, Error> run_batch(Records input, const PipelineSpec &spec, RecordIo &io);

} // namespace cardpipe
