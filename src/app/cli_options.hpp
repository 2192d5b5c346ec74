#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "core/command.hpp"
#include "core/error.hpp"
#include "core/record.hpp"
#include "execution/spec_runner.hpp"

namespace cardpipe {

enum class CliCommand {
    Help,
    Run,
    Debug,
};

struct CliOptions {
    CliCommand command{CliCommand::Help};
    std::string pipeline_path;
    std::string input_path;
    std::optional<std::string> output_path;
    ExecutionMode mode{ExecutionMode::Batch};
    bool verify{false};
    // 0-based; `--pipeline N` on the command line is 1-based.
    std::size_t pipeline_index{0};
};

inline constexpr std::string_view stdin_path = "-";

[[nodiscard]] std::string_view usage_text() noexcept;

[[nodiscard]] std::expected<CliOptions, Error> parse_cli(std::span<const std::string> args);

[[nodiscard]] std::expected<PipelineSpec, Error> load_spec(const std::string &path);
// `-` reads standard input.
[[nodiscard]] std::expected<Records, Error> load_input(const std::string &path);

} // namespace cardpipe
