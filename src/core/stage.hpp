#pragma once

#include <expected>
#include <memory>
#include <string_view>
#include <vector>

#include "core/command.hpp"
#include "core/error.hpp"
#include "core/record.hpp"

namespace cardpipe {

// A Command bound to runtime state. Instances are created fresh for every
// execution and never shared.
class Stage {
  public:
    virtual ~Stage() = default;

    // Zero or more output records for one input record.
    [[nodiscard]] virtual std::expected<Records, Error> step(const Record &record) = 0;

    // Called once, after every record (including upstream flush output) has
    // passed this stage.
    [[nodiscard]] virtual Records end_of_input() { return {}; }

    [[nodiscard]] virtual bool flushes() const noexcept { return false; }
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

using StageChain = std::vector<std::unique_ptr<Stage>>;

[[nodiscard]] std::unique_ptr<Stage> make_stage(const Command &command);
[[nodiscard]] StageChain make_stage_chain(const Pipeline &pipeline);

// Points a runtime failure at the DSL line and keyword of the failing stage.
[[nodiscard]] Error stage_failure(Error error, const Command &command);

} // namespace cardpipe
