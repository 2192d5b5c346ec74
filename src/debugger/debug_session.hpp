#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/command.hpp"
#include "core/error.hpp"
#include "core/record.hpp"
#include "execution/record_cursor.hpp"
#include "execution/spec_runner.hpp"

namespace cardpipe {

struct Watch {
    std::string label;
    std::size_t pipe_point{0};
};

struct WatchReport {
    std::string label;
    std::size_t pipe_point{0};
    bool reached{false};
    Records records;
};

struct DebugSnapshot {
    CursorPosition position;
    bool paused_at_breakpoint{false};
    Records in_flight;
    std::vector<WatchReport> watches;
    Records output;
    std::size_t stage_count{0};
    std::size_t input_count{0};
};

// Caller-driven stepping over one pipeline. Watches and breakpoints survive
// reset() and reinitialize(); the records observed at each pipe point are
// kept for the current journey only.
class DebugSession {
  public:
    DebugSession(Pipeline pipeline, Records input);

    // Steps pipeline `pipeline_index` of `spec`, fed by running the pipelines
    // before it. Files are read through `io` but never written.
    [[nodiscard]] static std::expected<DebugSession, Error> open(
        const PipelineSpec &spec, const Records &console_input, std::size_t pipeline_index, RecordIo &io);

    [[nodiscard]] std::expected<DebugSnapshot, Error> initialize();
    [[nodiscard]] std::expected<DebugSnapshot, Error> step();
    [[nodiscard]] std::expected<DebugSnapshot, Error> run_to_breakpoint();
    [[nodiscard]] std::expected<DebugSnapshot, Error> reset();
    [[nodiscard]] std::expected<DebugSnapshot, Error> reinitialize(Pipeline pipeline, Records input);

    [[nodiscard]] std::expected<DebugSnapshot, Error> add_watch(std::size_t pipe_point);
    [[nodiscard]] std::expected<DebugSnapshot, Error> remove_watch(const std::string &label);
    [[nodiscard]] std::expected<DebugSnapshot, Error> add_breakpoint(std::size_t pipe_point);
    [[nodiscard]] std::expected<DebugSnapshot, Error> remove_breakpoint(std::size_t pipe_point);

    [[nodiscard]] DebugSnapshot snapshot() const;

    [[nodiscard]] const Pipeline &pipeline() const noexcept { return cursor_.pipeline(); }
    [[nodiscard]] const std::vector<Watch> &watches() const noexcept { return watches_; }
    [[nodiscard]] const std::set<std::size_t> &breakpoints() const noexcept { return breakpoints_; }

  private:
    Records input_;
    RecordCursor cursor_;
    std::vector<Watch> watches_;
    std::size_t next_watch_id_{1};
    std::set<std::size_t> breakpoints_;
    std::vector<std::optional<Records>> journey_;
    bool paused_{false};

    [[nodiscard]] std::expected<void, Error> advance();
    [[nodiscard]] std::expected<void, Error> check_pipe_point(std::size_t pipe_point) const;
    void observe();
};

} // namespace cardpipe
