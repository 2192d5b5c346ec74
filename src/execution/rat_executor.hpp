#pragma once

#include <cstddef>
#include <expected>
#include <vector>

#include "core/command.hpp"
#include "core/error.hpp"
#include "core/record.hpp"

namespace cardpipe {

// Records observed at pipe points 0..S during one input record's journey.
struct RecordTrace {
    std::size_t record_index{0};
    std::vector<Records> pipe_points;
};

// Records observed at pipe points stage_index+1..S for one flush group.
struct FlushTrace {
    std::size_t flush_index{0};
    std::size_t stage_index{0};
    std::vector<Records> pipe_points;
};

struct ExecutionTrace {
    std::vector<RecordTrace> records;
    std::vector<FlushTrace> flushes;
    Records output;

    [[nodiscard]] std::size_t observation_count() const noexcept;
};

class RecordAtATimeExecutor {
  public:
    [[nodiscard]] std::expected<Records, Error> execute(const Pipeline &pipeline, Records input) const;
    [[nodiscard]] std::expected<ExecutionTrace, Error> trace(const Pipeline &pipeline, Records input) const;
};

} // namespace cardpipe
