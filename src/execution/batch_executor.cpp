#include "execution/batch_executor.hpp"

#include <utility>

namespace cardpipe {

std::expected<Records, Error> BatchExecutor::execute(const Pipeline &pipeline, Records input) const {
    StageChain stages = make_stage_chain(pipeline);

    auto output = run_stages(pipeline, stages, 0, std::move(input));
    if (!output.has_value()) {
        return output;
    }

    for (std::size_t index = 0; index < stages.size(); ++index) {
        auto flushed = run_stages(pipeline, stages, index + 1, stages[index]->end_of_input());
        if (!flushed.has_value()) {
            return flushed;
        }

        output->insert(output->end(), flushed->begin(), flushed->end());
    }

    return output;
}

std::expected<Records, Error> BatchExecutor::run_stages(
    const Pipeline &pipeline, StageChain &stages, std::size_t first_stage, Records records) {
    for (std::size_t index = first_stage; index < stages.size(); ++index) {
        Records next;
        next.reserve(records.size());

        for (const auto &record : records) {
            auto produced = stages[index]->step(record);
            if (!produced.has_value()) {
                return std::unexpected(stage_failure(std::move(produced.error()), pipeline.stages[index]));
            }

            next.insert(next.end(), produced->begin(), produced->end());
        }

        records = std::move(next);
    }

    return records;
}

} // namespace cardpipe
