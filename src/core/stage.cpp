#include "core/stage.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include "core/overloaded.hpp"

namespace cardpipe {

namespace {

[[nodiscard]] std::string_view trim_spaces(std::string_view text) {
    const auto first = text.find_first_not_of(' ');
    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = text.find_last_not_of(' ');
    return text.substr(first, last - first + 1);
}

class ConsoleStage final : public Stage {
  public:
    std::expected<Records, Error> step(const Record &record) override { return Records{record}; }
    std::string_view name() const noexcept override { return "CONSOLE"; }
};

class FilterStage final : public Stage {
  public:
    explicit FilterStage(FilterCommand command) : command_(std::move(command)) {}

    std::expected<Records, Error> step(const Record &record) override {
        auto field = record.field(command_.field.offset, command_.field.length);
        if (!field.has_value()) {
            return std::unexpected(field.error());
        }

        const bool equal = trim_spaces(*field) == trim_spaces(command_.value);
        const bool keep = command_.comparison == Comparison::Equal ? equal : !equal;

        if (!keep) {
            return Records{};
        }

        return Records{record};
    }

    std::string_view name() const noexcept override { return "FILTER"; }

  private:
    FilterCommand command_;
};

class LocateStage final : public Stage {
  public:
    explicit LocateStage(LocateCommand command) : command_(std::move(command)) {}

    std::expected<Records, Error> step(const Record &record) override {
        std::string_view haystack = record.text();

        if (command_.field.has_value()) {
            auto field = record.field(command_.field->offset, command_.field->length);
            if (!field.has_value()) {
                return std::unexpected(field.error());
            }
            haystack = *field;
        }

        const bool found = haystack.find(command_.pattern) != std::string_view::npos;
        if (found == command_.negate) {
            return Records{};
        }

        return Records{record};
    }

    std::string_view name() const noexcept override { return command_.negate ? "NLOCATE" : "LOCATE"; }

  private:
    LocateCommand command_;
};

// Replaces every non-overlapping occurrence, left to right.
class ChangeStage final : public Stage {
  public:
    explicit ChangeStage(ChangeCommand command) : command_(std::move(command)) {}

    std::expected<Records, Error> step(const Record &record) override {
        const std::string_view text = record.text();
        std::string result;
        result.reserve(text.size());

        std::size_t position = 0;
        while (true) {
            const auto hit = text.find(command_.from, position);
            if (hit == std::string_view::npos) {
                break;
            }

            result.append(text.substr(position, hit - position));
            result.append(command_.to);
            position = hit + command_.from.size();
        }
        result.append(text.substr(position));

        return Records{Record::padded(result)};
    }

    std::string_view name() const noexcept override { return "CHANGE"; }

  private:
    ChangeCommand command_;
};

class SelectStage final : public Stage {
  public:
    explicit SelectStage(SelectCommand command) : command_(std::move(command)) {}

    std::expected<Records, Error> step(const Record &record) override {
        Record output;

        for (const auto &field : command_.fields) {
            auto value = record.field(field.source.offset, field.source.length);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }

            if (auto copied = output.set_field(field.destination, field.source.length, *value); !copied.has_value()) {
                return std::unexpected(copied.error());
            }
        }

        return Records{output};
    }

    std::string_view name() const noexcept override { return "SELECT"; }

  private:
    SelectCommand command_;
};

class CaseStage final : public Stage {
  public:
    explicit CaseStage(bool upper) : upper_(upper) {}

    std::expected<Records, Error> step(const Record &record) override {
        std::string text(record.text());
        for (char &c : text) {
            const auto byte = static_cast<unsigned char>(c);
            c = static_cast<char>(upper_ ? std::toupper(byte) : std::tolower(byte));
        }

        return Records{Record::padded(text)};
    }

    std::string_view name() const noexcept override { return upper_ ? "UPPER" : "LOWER"; }

  private:
    bool upper_;
};

// Reverses the text up to the last non-blank column so it stays left-aligned.
class ReverseStage final : public Stage {
  public:
    std::expected<Records, Error> step(const Record &record) override {
        const std::string_view content = record.trimmed();
        const std::string reversed(content.rbegin(), content.rend());
        return Records{Record::padded(reversed)};
    }

    std::string_view name() const noexcept override { return "REVERSE"; }
};

class TakeStage final : public Stage {
  public:
    explicit TakeStage(std::size_t limit) : limit_(limit) {}

    std::expected<Records, Error> step(const Record &record) override {
        if (passed_ >= limit_) {
            return Records{};
        }

        ++passed_;
        return Records{record};
    }

    std::string_view name() const noexcept override { return "TAKE"; }

  private:
    std::size_t limit_;
    std::size_t passed_{0};
};

class SkipStage final : public Stage {
  public:
    explicit SkipStage(std::size_t limit) : limit_(limit) {}

    std::expected<Records, Error> step(const Record &record) override {
        if (skipped_ < limit_) {
            ++skipped_;
            return Records{};
        }

        return Records{record};
    }

    std::string_view name() const noexcept override { return "SKIP"; }

  private:
    std::size_t limit_;
    std::size_t skipped_{0};
};

class DuplicateStage final : public Stage {
  public:
    explicit DuplicateStage(std::size_t copies) : copies_(copies) {}

    std::expected<Records, Error> step(const Record &record) override { return Records(copies_, record); }

    std::string_view name() const noexcept override { return "DUPLICATE"; }

  private:
    std::size_t copies_;
};

class CountStage final : public Stage {
  public:
    std::expected<Records, Error> step(const Record & /*record*/) override {
        ++count_;
        return Records{};
    }

    Records end_of_input() override { return Records{Record::padded(std::to_string(count_))}; }

    bool flushes() const noexcept override { return true; }
    std::string_view name() const noexcept override { return "COUNT"; }

  private:
    std::size_t count_{0};
};

// Emits its literal once: ahead of the first record, or at end of input when
// no record ever arrived.
class LiteralStage final : public Stage {
  public:
    explicit LiteralStage(std::string text) : literal_(Record::padded(text)) {}

    std::expected<Records, Error> step(const Record &record) override {
        if (emitted_) {
            return Records{record};
        }

        emitted_ = true;
        return Records{literal_, record};
    }

    Records end_of_input() override {
        if (emitted_) {
            return {};
        }

        emitted_ = true;
        return Records{literal_};
    }

    bool flushes() const noexcept override { return true; }
    std::string_view name() const noexcept override { return "LITERAL"; }

  private:
    Record literal_;
    bool emitted_{false};
};

class HoleStage final : public Stage {
  public:
    std::expected<Records, Error> step(const Record & /*record*/) override { return Records{}; }
    std::string_view name() const noexcept override { return "HOLE"; }
};

} // namespace

std::unique_ptr<Stage> make_stage(const Command &command) {
    return std::visit(
        overloaded{
            [](const ConsoleCommand &) -> std::unique_ptr<Stage> { return std::make_unique<ConsoleStage>(); },
            [](const FilterCommand &filter) -> std::unique_ptr<Stage> { return std::make_unique<FilterStage>(filter); },
            [](const LocateCommand &locate) -> std::unique_ptr<Stage> { return std::make_unique<LocateStage>(locate); },
            [](const ChangeCommand &change) -> std::unique_ptr<Stage> { return std::make_unique<ChangeStage>(change); },
            [](const SelectCommand &select) -> std::unique_ptr<Stage> { return std::make_unique<SelectStage>(select); },
            [](const UpperCommand &) -> std::unique_ptr<Stage> { return std::make_unique<CaseStage>(true); },
            [](const LowerCommand &) -> std::unique_ptr<Stage> { return std::make_unique<CaseStage>(false); },
            [](const ReverseCommand &) -> std::unique_ptr<Stage> { return std::make_unique<ReverseStage>(); },
            [](const TakeCommand &take) -> std::unique_ptr<Stage> { return std::make_unique<TakeStage>(take.count); },
            [](const SkipCommand &skip) -> std::unique_ptr<Stage> { return std::make_unique<SkipStage>(skip.count); },
            [](const DuplicateCommand &duplicate) -> std::unique_ptr<Stage> {
                return std::make_unique<DuplicateStage>(duplicate.copies);
            },
            [](const CountCommand &) -> std::unique_ptr<Stage> { return std::make_unique<CountStage>(); },
            [](const LiteralCommand &literal) -> std::unique_ptr<Stage> {
                return std::make_unique<LiteralStage>(literal.text);
            },
            [](const HoleCommand &) -> std::unique_ptr<Stage> { return std::make_unique<HoleStage>(); },
        },
        command.op);
}

StageChain make_stage_chain(const Pipeline &pipeline) {
    StageChain chain;
    chain.reserve(pipeline.stages.size());

    for (const auto &command : pipeline.stages) {
        chain.push_back(make_stage(command));
    }

    return chain;
}

Error stage_failure(Error error, const Command &command) {
    if (error.line == 0) {
        error.line = command.line;
    }

    if (error.context.empty()) {
        error.context = std::string(keyword_of(command.op));
    }

    return error;
}

} // namespace cardpipe
