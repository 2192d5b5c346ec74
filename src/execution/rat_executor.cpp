#include "execution/rat_executor.hpp"

#include <utility>

#include "execution/record_cursor.hpp"

namespace cardpipe {

std::size_t ExecutionTrace::observation_count() const noexcept {
    std::size_t count = 0;

    for (const auto &record : records) {
        count += record.pipe_points.size();
    }
    for (const auto &flush : flushes) {
        count += flush.pipe_points.size();
    }

    return count;
}

std::expected<Records, Error> RecordAtATimeExecutor::execute(const Pipeline &pipeline, Records input) const {
    RecordCursor cursor(pipeline, std::move(input));

    while (!cursor.finished()) {
        if (auto advanced = cursor.advance(); !advanced.has_value()) {
            return std::unexpected(advanced.error());
        }
    }

    return cursor.output();
}

std::expected<ExecutionTrace, Error> RecordAtATimeExecutor::trace(const Pipeline &pipeline, Records input) const {
    RecordCursor cursor(pipeline, std::move(input));
    ExecutionTrace trace;

    while (!cursor.finished()) {
        if (auto advanced = cursor.advance(); !advanced.has_value()) {
            return std::unexpected(advanced.error());
        }

        const CursorPosition &position = cursor.position();

        if (const auto *at = std::get_if<AtPipePoint>(&position)) {
            if (at->pipe_point == 0) {
                trace.records.push_back(RecordTrace{.record_index = at->record_index, .pipe_points = {}});
            }
            trace.records.back().pipe_points.push_back(cursor.in_flight());
        } else if (const auto *at = std::get_if<AtFlush>(&position)) {
            if (at->pipe_point == at->stage_index + 1) {
                trace.flushes.push_back(
                    FlushTrace{.flush_index = at->flush_index, .stage_index = at->stage_index, .pipe_points = {}});
            }
            trace.flushes.back().pipe_points.push_back(cursor.in_flight());
        }
    }

    trace.output = cursor.output();
    return trace;
}

} // namespace cardpipe
