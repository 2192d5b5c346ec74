#include "execution/spec_runner.hpp"

#include <format>
#include <utility>

#include "execution/batch_executor.hpp"
#include "execution/rat_executor.hpp"

namespace cardpipe {

std::expected<Records, Error> ConsoleOnlyIo::read(const FileEndpoint &endpoint) {
    return std::unexpected(io_error(endpoint.path, "file sources are not available here"));
}

std::expected<void, Error> ConsoleOnlyIo::write(const FileEndpoint &endpoint, const Records & /*records*/) {
    return std::unexpected(io_error(endpoint.path, "file sinks are not available here"));
}

std::expected<Records, Error> execute_pipeline(const Pipeline &pipeline, Records input, ExecutionMode mode) {
    if (mode == ExecutionMode::RecordAtATime) {
        return RecordAtATimeExecutor{}.execute(pipeline, std::move(input));
    }

    return BatchExecutor{}.execute(pipeline, std::move(input));
}

SpecRunner::SpecRunner(RecordIo &io) : io_(io) {}

std::expected<RunResult, Error> SpecRunner::run(
    const PipelineSpec &spec, const Records &console_input, ExecutionMode mode) const {
    RunResult result;

    auto forwarded = run_prefix(spec, console_input, spec.pipelines.size(), mode, result);
    if (!forwarded.has_value()) {
        return std::unexpected(forwarded.error());
    }

    return result;
}

std::expected<Records, Error> SpecRunner::input_for(
    const PipelineSpec &spec, const Records &console_input, std::size_t index) const {
    if (index >= spec.pipelines.size()) {
        return std::unexpected(usage_error(
            std::format("pipeline {} does not exist (there are {})", index + 1, spec.pipelines.size())));
    }

    RunResult discarded;
    auto forwarded = run_prefix(spec, console_input, index, ExecutionMode::Batch, discarded);
    if (!forwarded.has_value()) {
        return std::unexpected(forwarded.error());
    }

    return resolve_input(spec.pipelines[index], std::move(*forwarded), console_input);
}

std::expected<std::optional<Records>, Error> SpecRunner::run_prefix(
    const PipelineSpec &spec,
    const Records &console_input,
    std::size_t count,
    ExecutionMode mode,
    RunResult &result) const {
    std::optional<Records> forwarded;

    for (std::size_t index = 0; index < count; ++index) {
        const Pipeline &pipeline = spec.pipelines[index];

        auto input = resolve_input(pipeline, std::move(forwarded), console_input);
        forwarded.reset();
        if (!input.has_value()) {
            return std::unexpected(input.error());
        }

        const std::size_t input_count = input->size();
        auto output = execute_pipeline(pipeline, std::move(*input), mode);
        if (!output.has_value()) {
            return std::unexpected(output.error());
        }

        result.reports.push_back(PipelineReport{.input_count = input_count, .output_count = output->size()});

        if (const auto *sink = std::get_if<FileEndpoint>(&pipeline.sink)) {
            if (auto written = io_.write(*sink, *output); !written.has_value()) {
                return std::unexpected(written.error());
            }
            continue;
        }

        const bool next_reads_console =
            index + 1 < spec.pipelines.size() && is_console(spec.pipelines[index + 1].source);
        if (next_reads_console) {
            forwarded = std::move(*output);
        } else {
            result.output.insert(result.output.end(), output->begin(), output->end());
        }
    }

    return forwarded;
}

std::expected<Records, Error> SpecRunner::resolve_input(
    const Pipeline &pipeline, std::optional<Records> forwarded, const Records &console_input) const {
    if (const auto *source = std::get_if<FileEndpoint>(&pipeline.source)) {
        return io_.read(*source);
    }

    if (forwarded.has_value()) {
        return std::move(*forwarded);
    }

    return console_input;
}

std::expected<Records, Error> run_batch(Records input, const PipelineSpec &spec) {
    ConsoleOnlyIo io;
    return run_batch(std::move(input), spec, io);
}

std::expected<Records, Error> run_batch(Records input, const PipelineSpec &spec, RecordIo &io) {
    auto result = SpecRunner(io).run(spec, input, ExecutionMode::Batch);
    if (!result.has_value()) {
        return std::unexpected(result.error());
    }

    return std::move(result->output);
}

} // namespace cardpipe
