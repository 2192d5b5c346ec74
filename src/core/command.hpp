#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cardpipe {

struct FieldRange {
    std::size_t offset;
    std::size_t length;

    bool operator==(const FieldRange &) const = default;
};

enum class Comparison {
    Equal,
    NotEqual,
};

struct ConsoleCommand {};

struct FilterCommand {
    FieldRange field;
    Comparison comparison;
    std::string value;
};

struct LocateCommand {
    std::optional<FieldRange> field;
    std::string pattern;
    bool negate{false};
};

struct ChangeCommand {
    std::string from;
    std::string to;
};

struct SelectField {
    FieldRange source;
    std::size_t destination;

    bool operator==(const SelectField &) const = default;
};

struct SelectCommand {
    std::vector<SelectField> fields;
};

struct UpperCommand {};
struct LowerCommand {};
struct ReverseCommand {};

struct TakeCommand {
    std::size_t count;
};

struct SkipCommand {
    std::size_t count;
};

struct DuplicateCommand {
    std::size_t copies{2};
};

struct CountCommand {};

struct LiteralCommand {
    std::string text;
};

struct HoleCommand {};

using CommandOp = std::variant<
    ConsoleCommand,
    FilterCommand,
    LocateCommand,
    ChangeCommand,
    SelectCommand,
    UpperCommand,
    LowerCommand,
    ReverseCommand,
    TakeCommand,
    SkipCommand,
    DuplicateCommand,
    CountCommand,
    LiteralCommand,
    HoleCommand>;

struct Command {
    CommandOp op;
    std::size_t line{0};
    std::string text;
};

enum class WriteMode {
    Truncate,
    Append,
};

struct ConsoleEndpoint {};

struct FileEndpoint {
    std::string path;
    WriteMode mode{WriteMode::Truncate};
};

using Endpoint = std::variant<ConsoleEndpoint, FileEndpoint>;

struct Pipeline {
    Endpoint source;
    std::vector<Command> stages;
    Endpoint sink;

    [[nodiscard]] std::size_t stage_count() const noexcept { return stages.size(); }
    [[nodiscard]] std::size_t pipe_point_count() const noexcept { return stages.size() + 1; }
};

struct PipelineSpec {
    std::vector<Pipeline> pipelines;

    [[nodiscard]] bool empty() const noexcept { return pipelines.empty(); }
};

[[nodiscard]] std::string_view keyword_of(const CommandOp &op) noexcept;
[[nodiscard]] bool is_console(const Endpoint &endpoint) noexcept;

} // namespace cardpipe
