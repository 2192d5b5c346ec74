#pragma once

#include <cstddef>
#include <expected>

#include "core/command.hpp"
#include "core/error.hpp"
#include "core/record.hpp"
#include "core/stage.hpp"

namespace cardpipe {

// Runs the whole record sequence through one stage before moving on to the
// next, then threads each stage's end-of-input emission through the stages
// downstream of it.
class BatchExecutor {
  public:
    [[nodiscard]] std::expected<Records, Error> execute(const Pipeline &pipeline, Records input) const;

  private:
    [[nodiscard]] static std::expected<Records, Error> run_stages(
        const Pipeline &pipeline, StageChain &stages, std::size_t first_stage, Records records);
};

} // namespace cardpipe
