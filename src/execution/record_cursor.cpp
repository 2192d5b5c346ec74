#include "execution/record_cursor.hpp"

#include <format>
#include <utility>

#include "core/overloaded.hpp"

namespace cardpipe {

std::optional<std::size_t> pipe_point_of(const CursorPosition &position) noexcept {
    if (const auto *at = std::get_if<AtPipePoint>(&position)) {
        return at->pipe_point;
    }

    if (const auto *at = std::get_if<AtFlush>(&position)) {
        return at->pipe_point;
    }

    return std::nullopt;
}

std::string describe(const CursorPosition &position) {
    return std::visit(
        overloaded{
            [](const NotStarted &) -> std::string { return "not started"; },
            [](const AtPipePoint &at) -> std::string {
                return std::format("record {} at pipe point {}", at.record_index + 1, at.pipe_point);
            },
            [](const AtFlush &at) -> std::string {
                return std::format(
                    "flush {} from stage {} at pipe point {}", at.flush_index + 1, at.stage_index + 1, at.pipe_point);
            },
            [](const Finished &) -> std::string { return "finished"; },
        },
        position);
}

RecordCursor::RecordCursor(Pipeline pipeline, Records input)
    : pipeline_(std::move(pipeline)), stages_(make_stage_chain(pipeline_)), input_(std::move(input)) {}

std::expected<void, Error> RecordCursor::advance() {
    const std::size_t stage_count = stages_.size();
    const CursorPosition current = position_;

    if (std::holds_alternative<NotStarted>(current)) {
        if (input_.empty()) {
            enter_flush_phase(0);
        } else {
            start_record(0);
        }
        return {};
    }

    if (const auto *at = std::get_if<AtPipePoint>(&current)) {
        if (at->pipe_point < stage_count) {
            if (auto applied = apply_stage(at->pipe_point); !applied.has_value()) {
                return applied;
            }
            position_ = AtPipePoint{.record_index = at->record_index, .pipe_point = at->pipe_point + 1};
            return {};
        }

        output_.insert(output_.end(), in_flight_.begin(), in_flight_.end());
        if (at->record_index + 1 < input_.size()) {
            start_record(at->record_index + 1);
        } else {
            enter_flush_phase(0);
        }
        return {};
    }

    if (const auto *at = std::get_if<AtFlush>(&current)) {
        if (at->pipe_point < stage_count) {
            if (auto applied = apply_stage(at->pipe_point); !applied.has_value()) {
                return applied;
            }
            position_ = AtFlush{
                .flush_index = at->flush_index, .stage_index = at->stage_index, .pipe_point = at->pipe_point + 1};
            return {};
        }

        output_.insert(output_.end(), in_flight_.begin(), in_flight_.end());
        enter_flush_phase(at->stage_index + 1);
        return {};
    }

    return {};
}

std::expected<void, Error> RecordCursor::apply_stage(std::size_t index) {
    Records next;

    for (const auto &record : in_flight_) {
        auto produced = stages_[index]->step(record);
        if (!produced.has_value()) {
            return std::unexpected(stage_failure(std::move(produced.error()), pipeline_.stages[index]));
        }

        next.insert(next.end(), produced->begin(), produced->end());
    }

    in_flight_ = std::move(next);
    return {};
}

void RecordCursor::start_record(std::size_t record_index) {
    in_flight_ = Records{input_[record_index]};
    position_ = AtPipePoint{.record_index = record_index, .pipe_point = 0};
}

void RecordCursor::enter_flush_phase(std::size_t first_stage) {
    for (std::size_t index = first_stage; index < stages_.size(); ++index) {
        Records emitted = stages_[index]->end_of_input();

        if (stages_[index]->flushes() || !emitted.empty()) {
            in_flight_ = std::move(emitted);
            position_ = AtFlush{.flush_index = flush_count_++, .stage_index = index, .pipe_point = index + 1};
            return;
        }
    }

    in_flight_.clear();
    position_ = Finished{};
}

} // namespace cardpipe
