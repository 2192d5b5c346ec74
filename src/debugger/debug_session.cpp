#include "debugger/debug_session.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "io/memory_record_io.hpp"

namespace cardpipe {

DebugSession::DebugSession(Pipeline pipeline, Records input)
    : input_(std::move(input)), cursor_(std::move(pipeline), input_) {}

std::expected<DebugSession, Error> DebugSession::open(
    const PipelineSpec &spec, const Records &console_input, std::size_t pipeline_index, RecordIo &io) {
    // The earlier pipelines only replay; their file sinks stay in memory.
    MemoryRecordIo replay(&io);
    auto input = SpecRunner(replay).input_for(spec, console_input, pipeline_index);
    if (!input.has_value()) {
        return std::unexpected(input.error());
    }

    return DebugSession(spec.pipelines[pipeline_index], std::move(*input));
}

std::expected<DebugSnapshot, Error> DebugSession::initialize() {
    if (std::holds_alternative<NotStarted>(cursor_.position())) {
        if (auto advanced = advance(); !advanced.has_value()) {
            return std::unexpected(advanced.error());
        }
    }

    return snapshot();
}

std::expected<DebugSnapshot, Error> DebugSession::step() {
    paused_ = false;

    if (std::holds_alternative<NotStarted>(cursor_.position())) {
        return initialize();
    }

    if (!cursor_.finished()) {
        if (auto advanced = advance(); !advanced.has_value()) {
            return std::unexpected(advanced.error());
        }
    }

    return snapshot();
}

std::expected<DebugSnapshot, Error> DebugSession::run_to_breakpoint() {
    paused_ = false;

    while (!cursor_.finished()) {
        if (auto advanced = advance(); !advanced.has_value()) {
            return std::unexpected(advanced.error());
        }

        const auto pipe_point = pipe_point_of(cursor_.position());
        if (pipe_point.has_value() && breakpoints_.contains(*pipe_point)) {
            paused_ = true;
            break;
        }
    }

    return snapshot();
}

std::expected<DebugSnapshot, Error> DebugSession::reset() {
    cursor_ = RecordCursor(cursor_.pipeline(), input_);
    journey_.clear();
    paused_ = false;

    return initialize();
}

std::expected<DebugSnapshot, Error> DebugSession::reinitialize(Pipeline pipeline, Records input) {
    const std::size_t stage_count = pipeline.stage_count();

    std::erase_if(watches_, [stage_count](const Watch &watch) { return watch.pipe_point > stage_count; });
    std::erase_if(breakpoints_, [stage_count](std::size_t pipe_point) { return pipe_point > stage_count; });

    input_ = std::move(input);
    cursor_ = RecordCursor(std::move(pipeline), input_);
    journey_.clear();
    paused_ = false;

    return initialize();
}

std::expected<DebugSnapshot, Error> DebugSession::add_watch(std::size_t pipe_point) {
    if (auto valid = check_pipe_point(pipe_point); !valid.has_value()) {
        return std::unexpected(valid.error());
    }

    watches_.push_back(Watch{.label = std::format("w{}", next_watch_id_++), .pipe_point = pipe_point});
    return snapshot();
}

std::expected<DebugSnapshot, Error> DebugSession::remove_watch(const std::string &label) {
    const auto removed = std::erase_if(watches_, [&label](const Watch &watch) { return watch.label == label; });
    if (removed == 0) {
        return std::unexpected(usage_error(std::format("no watch named '{}'", label)));
    }

    return snapshot();
}

std::expected<DebugSnapshot, Error> DebugSession::add_breakpoint(std::size_t pipe_point) {
    if (auto valid = check_pipe_point(pipe_point); !valid.has_value()) {
        return std::unexpected(valid.error());
    }

    breakpoints_.insert(pipe_point);
    return snapshot();
}

std::expected<DebugSnapshot, Error> DebugSession::remove_breakpoint(std::size_t pipe_point) {
    if (breakpoints_.erase(pipe_point) == 0) {
        return std::unexpected(usage_error(std::format("no breakpoint at pipe point {}", pipe_point)));
    }

    return snapshot();
}

DebugSnapshot DebugSession::snapshot() const {
    DebugSnapshot snapshot{
        .position = cursor_.position(),
        .paused_at_breakpoint = paused_,
        .in_flight = cursor_.in_flight(),
        .watches = {},
        .output = cursor_.output(),
        .stage_count = cursor_.stage_count(),
        .input_count = cursor_.input_count(),
    };

    for (const auto &watch : watches_) {
        WatchReport report{.label = watch.label, .pipe_point = watch.pipe_point, .reached = false, .records = {}};

        if (watch.pipe_point < journey_.size() && journey_[watch.pipe_point].has_value()) {
            report.reached = true;
            report.records = *journey_[watch.pipe_point];
        }

        snapshot.watches.push_back(std::move(report));
    }

    return snapshot;
}

std::expected<void, Error> DebugSession::advance() {
    if (auto advanced = cursor_.advance(); !advanced.has_value()) {
        return advanced;
    }

    observe();
    return {};
}

std::expected<void, Error> DebugSession::check_pipe_point(std::size_t pipe_point) const {
    if (pipe_point > cursor_.stage_count()) {
        return std::unexpected(usage_error(
            std::format("pipe point {} is outside 0..{}", pipe_point, cursor_.stage_count())));
    }

    return {};
}

void DebugSession::observe() {
    const CursorPosition &position = cursor_.position();

    const auto *record = std::get_if<AtPipePoint>(&position);
    const auto *flush = std::get_if<AtFlush>(&position);

    const bool journey_starts = (record != nullptr && record->pipe_point == 0) ||
                                (flush != nullptr && flush->pipe_point == flush->stage_index + 1);
    if (journey_starts) {
        journey_.assign(cursor_.stage_count() + 1, std::nullopt);
    }

    if (const auto pipe_point = pipe_point_of(position); pipe_point.has_value()) {
        journey_[*pipe_point] = cursor_.in_flight();
    } else {
        journey_.clear();
    }
}

} // namespace cardpipe
