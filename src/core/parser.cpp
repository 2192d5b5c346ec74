#include "core/parser.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include "core/record.hpp"

namespace cardpipe {

namespace {

struct FileRead {
    std::string path;
};

struct FileWrite {
    FileEndpoint endpoint;
};

using StageItem = std::variant<Command, FileRead, FileWrite>;

struct ParsedLine {
    StageItem item;
    std::size_t line;
    bool terminates{false};
};

[[nodiscard]] bool is_ascii(std::string_view text) {
    for (const char c : text) {
        if (static_cast<unsigned char>(c) > 0x7f) {
            return false;
        }
    }

    return true;
}

[[nodiscard]] bool is_console_item(const StageItem &item) {
    const auto *command = std::get_if<Command>(&item);
    return command != nullptr && std::holds_alternative<ConsoleCommand>(command->op);
}

// Cursor over the arguments of one stage line.
class LineScanner {
  public:
    explicit LineScanner(const SourceLine &line) : line_(line), rest_(line.text) {}

    [[nodiscard]] std::expected<ParsedLine, Error> parse_stage();

  private:
    const SourceLine &line_;
    std::string_view rest_;
    std::size_t stage_end_{0};

    [[nodiscard]] Error fail(std::string message) const { return parse_error(line_.number, std::move(message)); }

    void skip_blanks() {
        while (!rest_.empty() && std::isspace(static_cast<unsigned char>(rest_.front()))) {
            rest_.remove_prefix(1);
        }
    }

    [[nodiscard]] bool next_is(char c) {
        skip_blanks();
        return !rest_.empty() && rest_.front() == c;
    }

    [[nodiscard]] bool next_is_digit() {
        skip_blanks();
        return !rest_.empty() && std::isdigit(static_cast<unsigned char>(rest_.front()));
    }

    [[nodiscard]] std::string read_keyword();
    [[nodiscard]] std::expected<std::size_t, Error> read_number(std::string_view what);
    [[nodiscard]] std::expected<FieldRange, Error> read_range(std::string_view keyword);
    [[nodiscard]] std::expected<std::string, Error> read_quoted(std::string_view keyword);
    [[nodiscard]] std::expected<char, Error> read_delimiter(std::string_view keyword);
    [[nodiscard]] std::expected<std::string, Error> read_delimited(char delimiter, std::string_view keyword);
    [[nodiscard]] std::expected<std::string, Error> read_path(std::string_view keyword);
    [[nodiscard]] std::expected<bool, Error> finish(std::string_view keyword);

    [[nodiscard]] std::expected<CommandOp, Error> parse_filter();
    [[nodiscard]] std::expected<CommandOp, Error> parse_locate(bool negate);
    [[nodiscard]] std::expected<CommandOp, Error> parse_change();
    [[nodiscard]] std::expected<CommandOp, Error> parse_select();
    [[nodiscard]] std::expected<CommandOp, Error> parse_duplicate();
};

std::string LineScanner::read_keyword() {
    skip_blanks();

    if (rest_.starts_with(">>")) {
        rest_.remove_prefix(2);
        return ">>";
    }

    if (!rest_.empty() && (rest_.front() == '>' || rest_.front() == '<')) {
        std::string keyword(1, rest_.front());
        rest_.remove_prefix(1);
        return keyword;
    }

    std::string keyword;
    while (!rest_.empty() && std::isalpha(static_cast<unsigned char>(rest_.front()))) {
        keyword.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(rest_.front()))));
        rest_.remove_prefix(1);
    }

    return keyword;
}

std::expected<std::size_t, Error> LineScanner::read_number(std::string_view what) {
    skip_blanks();

    std::size_t value = 0;
    const char *first = rest_.data();
    const char *last = rest_.data() + rest_.size();
    auto [ptr, ec] = std::from_chars(first, last, value);

    if (ec == std::errc::result_out_of_range) {
        return std::unexpected(fail(std::format("{} is too large", what)));
    }

    if (ec != std::errc{} || ptr == first || (first != last && *first == '-')) {
        return std::unexpected(fail(std::format("{} must be a non-negative integer", what)));
    }

    rest_.remove_prefix(static_cast<std::size_t>(ptr - first));
    return value;
}

std::expected<FieldRange, Error> LineScanner::read_range(std::string_view keyword) {
    auto offset = read_number(std::format("{} field offset", keyword));
    if (!offset.has_value()) {
        return std::unexpected(offset.error());
    }

    if (!next_is(',')) {
        return std::unexpected(fail(std::format("{} field range must be written offset,length", keyword)));
    }
    rest_.remove_prefix(1);

    auto length = read_number(std::format("{} field length", keyword));
    if (!length.has_value()) {
        return std::unexpected(length.error());
    }

    if (!check_field_range(*offset, *length).has_value()) {
        return std::unexpected(fail(
            std::format("{} field {},{} must have length > 0 and end within column {}",
                        keyword,
                        *offset,
                        *length,
                        record_width)));
    }

    return FieldRange{.offset = *offset, .length = *length};
}

std::expected<std::string, Error> LineScanner::read_quoted(std::string_view keyword) {
    if (!next_is('"')) {
        return std::unexpected(fail(std::format("{} requires a quoted string", keyword)));
    }
    rest_.remove_prefix(1);

    std::string value;
    bool escaped = false;

    while (!rest_.empty()) {
        const char current = rest_.front();
        rest_.remove_prefix(1);

        if (escaped) {
            if (current != '\\' && current != '"') {
                value.push_back('\\');
            }
            value.push_back(current);
            escaped = false;
            continue;
        }

        if (current == '\\') {
            escaped = true;
            continue;
        }

        if (current == '"') {
            if (!is_ascii(value)) {
                return std::unexpected(fail(std::format("{} string contains non-ASCII characters", keyword)));
            }
            return value;
        }

        value.push_back(current);
    }

    return std::unexpected(fail(std::format("unterminated quoted string in {}", keyword)));
}

std::expected<char, Error> LineScanner::read_delimiter(std::string_view keyword) {
    skip_blanks();

    if (rest_.empty()) {
        return std::unexpected(fail(std::format("{} requires a delimited pattern such as /text/", keyword)));
    }

    const char delimiter = rest_.front();
    if (std::isalnum(static_cast<unsigned char>(delimiter)) || delimiter == '"' || delimiter == ',') {
        return std::unexpected(fail(std::format("'{}' cannot delimit a {} pattern", delimiter, keyword)));
    }

    rest_.remove_prefix(1);
    return delimiter;
}

std::expected<std::string, Error> LineScanner::read_delimited(char delimiter, std::string_view keyword) {
    const auto end = rest_.find(delimiter);
    if (end == std::string_view::npos) {
        return std::unexpected(
            fail(std::format("unterminated pattern in {}: missing closing '{}'", keyword, delimiter)));
    }

    std::string value(rest_.substr(0, end));
    rest_.remove_prefix(end + 1);

    if (!is_ascii(value)) {
        return std::unexpected(fail(std::format("{} pattern contains non-ASCII characters", keyword)));
    }

    return value;
}

std::expected<std::string, Error> LineScanner::read_path(std::string_view keyword) {
    if (next_is('"')) {
        return read_quoted(keyword);
    }

    std::size_t length = 0;
    while (length < rest_.size() && !std::isspace(static_cast<unsigned char>(rest_[length]))) {
        ++length;
    }

    // "> out.txt?" ends the pipeline after the sink; "> out.txt|" is the older
    // line ending.
    while (length > 1 && (rest_[length - 1] == '?' || rest_[length - 1] == '|')) {
        --length;
    }

    if (length == 0) {
        return std::unexpected(fail(std::format("{} requires a file name", keyword)));
    }

    std::string path(rest_.substr(0, length));
    rest_.remove_prefix(length);
    return path;
}

std::expected<bool, Error> LineScanner::finish(std::string_view keyword) {
    skip_blanks();
    stage_end_ = line_.text.size() - rest_.size();

    // Older pipeline files end each stage line with '|'.
    if (!rest_.empty() && rest_.front() == '|') {
        rest_.remove_prefix(1);
        skip_blanks();
    }

    if (rest_.empty()) {
        return false;
    }

    if (rest_ == "?") {
        return true;
    }

    return std::unexpected(fail(std::format("unexpected text '{}' after {}", rest_, keyword)));
}

std::expected<CommandOp, Error> LineScanner::parse_filter() {
    auto field = read_range("FILTER");
    if (!field.has_value()) {
        return std::unexpected(field.error());
    }

    skip_blanks();
    Comparison comparison = Comparison::Equal;

    if (rest_.starts_with("!=")) {
        comparison = Comparison::NotEqual;
        rest_.remove_prefix(2);
    } else if (rest_.starts_with("=")) {
        rest_.remove_prefix(1);
    } else {
        return std::unexpected(fail("FILTER requires = or != after the field range"));
    }

    auto value = read_quoted("FILTER");
    if (!value.has_value()) {
        return std::unexpected(value.error());
    }

    return FilterCommand{.field = *field, .comparison = comparison, .value = std::move(*value)};
}

std::expected<CommandOp, Error> LineScanner::parse_locate(bool negate) {
    const std::string_view keyword = negate ? "NLOCATE" : "LOCATE";
    LocateCommand locate{.field = std::nullopt, .pattern = {}, .negate = negate};

    if (next_is_digit()) {
        auto field = read_range(keyword);
        if (!field.has_value()) {
            return std::unexpected(field.error());
        }
        locate.field = *field;
    }

    auto delimiter = read_delimiter(keyword);
    if (!delimiter.has_value()) {
        return std::unexpected(delimiter.error());
    }

    auto pattern = read_delimited(*delimiter, keyword);
    if (!pattern.has_value()) {
        return std::unexpected(pattern.error());
    }

    if (pattern->empty()) {
        return std::unexpected(fail(std::format("{} pattern must not be empty", keyword)));
    }

    locate.pattern = std::move(*pattern);
    return locate;
}

std::expected<CommandOp, Error> LineScanner::parse_change() {
    auto delimiter = read_delimiter("CHANGE");
    if (!delimiter.has_value()) {
        return std::unexpected(delimiter.error());
    }

    auto from = read_delimited(*delimiter, "CHANGE");
    if (!from.has_value()) {
        return std::unexpected(from.error());
    }

    if (from->empty()) {
        return std::unexpected(fail("CHANGE search string must not be empty"));
    }

    auto to = read_delimited(*delimiter, "CHANGE");
    if (!to.has_value()) {
        return std::unexpected(to.error());
    }

    return ChangeCommand{.from = std::move(*from), .to = std::move(*to)};
}

std::expected<CommandOp, Error> LineScanner::parse_select() {
    SelectCommand select;
    std::size_t next_destination = 0;

    while (true) {
        auto source = read_range("SELECT");
        if (!source.has_value()) {
            return std::unexpected(source.error());
        }

        std::size_t destination = next_destination;
        if (next_is(',')) {
            rest_.remove_prefix(1);
            auto explicit_destination = read_number("SELECT destination");
            if (!explicit_destination.has_value()) {
                return std::unexpected(explicit_destination.error());
            }
            destination = *explicit_destination;
        }

        if (!check_field_range(destination, source->length).has_value()) {
            return std::unexpected(fail(std::format(
                "SELECT destination {} with length {} ends past column {}",
                destination,
                source->length,
                record_width)));
        }

        select.fields.push_back(SelectField{.source = *source, .destination = destination});
        next_destination = destination + source->length;

        if (!next_is(';')) {
            break;
        }
        rest_.remove_prefix(1);

        skip_blanks();
        if (rest_.empty() || rest_ == "?") {
            break;
        }
    }

    return select;
}

std::expected<CommandOp, Error> LineScanner::parse_duplicate() {
    if (!next_is_digit()) {
        return DuplicateCommand{};
    }

    auto copies = read_number("DUPLICATE count");
    if (!copies.has_value()) {
        return std::unexpected(copies.error());
    }

    return DuplicateCommand{.copies = *copies};
}

std::expected<ParsedLine, Error> LineScanner::parse_stage() {
    const std::string keyword = read_keyword();
    if (keyword.empty()) {
        return std::unexpected(fail(std::format("expected a stage keyword, found '{}'", rest_)));
    }

    std::expected<StageItem, Error> item = std::unexpected(fail(std::format("unknown command '{}'", keyword)));

    auto wrap = [&](std::expected<CommandOp, Error> op) -> std::expected<StageItem, Error> {
        if (!op.has_value()) {
            return std::unexpected(op.error());
        }
        return Command{.op = std::move(*op), .line = line_.number, .text = {}};
    };

    if (keyword == "CONSOLE") {
        item = wrap(ConsoleCommand{});
    } else if (keyword == "<") {
        auto path = read_path("<");
        item = path.has_value() ? std::expected<StageItem, Error>(FileRead{.path = std::move(*path)})
                                : std::unexpected(path.error());
    } else if (keyword == ">" || keyword == ">>") {
        auto path = read_path(keyword);
        const WriteMode mode = keyword == ">>" ? WriteMode::Append : WriteMode::Truncate;
        item = path.has_value()
                   ? std::expected<StageItem, Error>(FileWrite{.endpoint = {.path = std::move(*path), .mode = mode}})
                   : std::unexpected(path.error());
    } else if (keyword == "FILTER") {
        item = wrap(parse_filter());
    } else if (keyword == "LOCATE") {
        item = wrap(parse_locate(false));
    } else if (keyword == "NLOCATE") {
        item = wrap(parse_locate(true));
    } else if (keyword == "CHANGE") {
        item = wrap(parse_change());
    } else if (keyword == "SELECT") {
        item = wrap(parse_select());
    } else if (keyword == "UPPER") {
        item = wrap(UpperCommand{});
    } else if (keyword == "LOWER") {
        item = wrap(LowerCommand{});
    } else if (keyword == "REVERSE") {
        item = wrap(ReverseCommand{});
    } else if (keyword == "TAKE" || keyword == "SKIP") {
        auto count = read_number(std::format("{} count", keyword));
        if (!count.has_value()) {
            item = std::unexpected(count.error());
        } else if (keyword == "TAKE") {
            item = wrap(TakeCommand{.count = *count});
        } else {
            item = wrap(SkipCommand{.count = *count});
        }
    } else if (keyword == "DUPLICATE") {
        item = wrap(parse_duplicate());
    } else if (keyword == "COUNT") {
        item = wrap(CountCommand{});
    } else if (keyword == "LITERAL") {
        auto text = read_quoted("LITERAL");
        item = text.has_value() ? wrap(LiteralCommand{.text = std::move(*text)}) : std::unexpected(text.error());
    } else if (keyword == "HOLE") {
        item = wrap(HoleCommand{});
    }

    if (!item.has_value()) {
        return std::unexpected(item.error());
    }

    auto terminates = finish(keyword);
    if (!terminates.has_value()) {
        return std::unexpected(terminates.error());
    }

    if (auto *command = std::get_if<Command>(&*item); command != nullptr) {
        std::string_view text = std::string_view(line_.text).substr(0, stage_end_);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }
        command->text = std::string(text);
    }

    return ParsedLine{.item = std::move(*item), .line = line_.number, .terminates = *terminates};
}

[[nodiscard]] std::expected<Pipeline, Error> assemble(std::vector<ParsedLine> &items) {
    Pipeline pipeline{.source = ConsoleEndpoint{}, .stages = {}, .sink = ConsoleEndpoint{}};

    std::size_t first = 0;
    std::size_t last = items.size();

    if (auto *read = std::get_if<FileRead>(&items.front().item); read != nullptr) {
        pipeline.source = FileEndpoint{.path = std::move(read->path), .mode = WriteMode::Truncate};
        first = 1;
    } else if (is_console_item(items.front().item)) {
        first = 1;
    }

    if (last > first) {
        if (auto *write = std::get_if<FileWrite>(&items.back().item); write != nullptr) {
            pipeline.sink = std::move(write->endpoint);
            --last;
        } else if (is_console_item(items.back().item)) {
            --last;
        }
    }

    for (std::size_t i = first; i < last; ++i) {
        auto &parsed = items[i];

        if (std::holds_alternative<FileRead>(parsed.item)) {
            return std::unexpected(parse_error(parsed.line, "'<' must be the first stage of a pipeline"));
        }

        if (std::holds_alternative<FileWrite>(parsed.item)) {
            return std::unexpected(parse_error(parsed.line, "'>' and '>>' must be the last stage of a pipeline"));
        }

        pipeline.stages.push_back(std::move(std::get<Command>(parsed.item)));
    }

    return pipeline;
}

} // namespace

std::expected<PipelineSpec, Error> Parser::parse(std::string_view text) const {
    Tokenizer tokenizer;
    const auto lines = tokenizer.split(text);
    return parse(lines);
}

std::expected<PipelineSpec, Error> Parser::parse(std::span<const SourceLine> lines) const {
    PipelineSpec spec;
    std::vector<ParsedLine> current;

    auto close_pipeline = [&]() -> std::expected<void, Error> {
        auto pipeline = assemble(current);
        current.clear();
        if (!pipeline.has_value()) {
            return std::unexpected(pipeline.error());
        }

        spec.pipelines.push_back(std::move(*pipeline));
        return {};
    };

    for (const auto &line : lines) {
        if (line.terminator) {
            if (current.empty()) {
                return std::unexpected(parse_error(line.number, "'?' ends an empty pipeline"));
            }

            if (auto closed = close_pipeline(); !closed.has_value()) {
                return std::unexpected(closed.error());
            }
            continue;
        }

        if (line.pipe_keyword && !current.empty()) {
            return std::unexpected(
                parse_error(line.number, "PIPE starts a new pipeline before '?' ended the previous one"));
        }

        if (line.text.empty()) {
            if (line.continuation) {
                return std::unexpected(parse_error(line.number, "missing stage after '|'"));
            }
            continue;
        }

        LineScanner scanner(line);
        auto parsed = scanner.parse_stage();
        if (!parsed.has_value()) {
            return std::unexpected(parsed.error());
        }

        const bool terminates = parsed->terminates;
        current.push_back(std::move(*parsed));

        if (terminates) {
            if (auto closed = close_pipeline(); !closed.has_value()) {
                return std::unexpected(closed.error());
            }
        }
    }

    if (!current.empty()) {
        if (auto closed = close_pipeline(); !closed.has_value()) {
            return std::unexpected(closed.error());
        }
    }

    if (spec.empty()) {
        return std::unexpected(parse_error(0, "pipeline text contains no stages"));
    }

    return spec;
}

} // namespace cardpipe
