#pragma once

#include <expected>
#include <span>
#include <string_view>

#include "core/command.hpp"
#include "core/error.hpp"
#include "core/tokenizer.hpp"

namespace cardpipe {

class Parser {
  public:
    [[nodiscard]] std::expected<PipelineSpec, Error> parse(std::string_view text) const;
    [[nodiscard]] std::expected<PipelineSpec, Error> parse(std::span<const SourceLine> lines) const;
};

} // namespace cardpipe
