#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <variant>

#include "core/command.hpp"
#include "core/error.hpp"
#include "core/record.hpp"
#include "core/stage.hpp"

namespace cardpipe {

struct NotStarted {
    bool operator==(const NotStarted &) const = default;
};

// Input record `record_index` is sitting at boundary `pipe_point` (0 is before
// the first stage, stage_count after the last).
struct AtPipePoint {
    std::size_t record_index{0};
    std::size_t pipe_point{0};

    bool operator==(const AtPipePoint &) const = default;
};

// The `flush_index`-th flush group, emitted by stage `stage_index`, sitting at
// boundary `pipe_point` (always greater than stage_index).
struct AtFlush {
    std::size_t flush_index{0};
    std::size_t stage_index{0};
    std::size_t pipe_point{0};

    bool operator==(const AtFlush &) const = default;
};

struct Finished {
    bool operator==(const Finished &) const = default;
};

using CursorPosition = std::variant<NotStarted, AtPipePoint, AtFlush, Finished>;

[[nodiscard]] std::optional<std::size_t> pipe_point_of(const CursorPosition &position) noexcept;
[[nodiscard]] std::string describe(const CursorPosition &position);

// Resumable record-at-a-time engine: every advance() moves the records in
// flight across exactly one pipe point.
class RecordCursor {
  public:
    RecordCursor(Pipeline pipeline, Records input);

    RecordCursor(const RecordCursor &) = delete;
    RecordCursor &operator=(const RecordCursor &) = delete;
    RecordCursor(RecordCursor &&) noexcept = default;
    RecordCursor &operator=(RecordCursor &&) noexcept = default;

    [[nodiscard]] std::expected<void, Error> advance();

    [[nodiscard]] const CursorPosition &position() const noexcept { return position_; }
    [[nodiscard]] const Records &in_flight() const noexcept { return in_flight_; }
    [[nodiscard]] const Records &output() const noexcept { return output_; }
    [[nodiscard]] const Pipeline &pipeline() const noexcept { return pipeline_; }
    [[nodiscard]] std::size_t stage_count() const noexcept { return stages_.size(); }
    [[nodiscard]] std::size_t input_count() const noexcept { return input_.size(); }
    [[nodiscard]] bool finished() const noexcept { return std::holds_alternative<Finished>(position_); }

  private:
    Pipeline pipeline_;
    StageChain stages_;
    Records input_;
    CursorPosition position_{NotStarted{}};
    Records in_flight_;
    Records output_;
    std::size_t flush_count_{0};

    [[nodiscard]] std::expected<void, Error> apply_stage(std::size_t index);
    void start_record(std::size_t record_index);
    void enter_flush_phase(std::size_t first_stage);
};

} // namespace cardpipe
