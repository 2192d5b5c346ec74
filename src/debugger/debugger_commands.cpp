#include "debugger/debugger_commands.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <format>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

#include <readline/history.h>

#include "core/command.hpp"
#include "history/history_manager.hpp"

namespace cardpipe {

namespace {

struct HelpEntry {
    std::string_view usage;
    std::string_view summary;
};

constexpr std::array<HelpEntry, 14> help_entries{{
    {.usage = "step [n]", .summary = "advance n pipe points (default 1), ignoring breakpoints"},
    {.usage = "run", .summary = "advance until a breakpoint or the end of the run"},
    {.usage = "reset", .summary = "start over with fresh stages, keeping watches and breakpoints"},
    {.usage = "where", .summary = "show the current position and the records in flight"},
    {.usage = "watch <p>", .summary = "watch pipe point p"},
    {.usage = "unwatch <wN>", .summary = "remove watch wN"},
    {.usage = "break <p>", .summary = "set a breakpoint at pipe point p"},
    {.usage = "clear <p>", .summary = "remove the breakpoint at pipe point p"},
    {.usage = "watches", .summary = "list watches and breakpoints"},
    {.usage = "stages", .summary = "list the stages between pipe points"},
    {.usage = "output", .summary = "show the output collected so far"},
    {.usage = "history [n]", .summary = "show the last n commands"},
    {.usage = "help", .summary = "show this text"},
    {.usage = "quit", .summary = "leave the debugger (also: exit)"},
}};

template <typename T> [[nodiscard]] bool parse_number(const std::string &token, T &value) {
    const char *first = token.data();
    const char *last = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(first, last, value);

    return ec == std::errc{} && ptr == last;
}

[[nodiscard]] std::string count_of(std::size_t count) {
    return std::format("{} record{}", count, count == 1 ? "" : "s");
}

void print_records(std::ostream &out, const Records &records) {
    for (const auto &record : records) {
        out << "    |" << record.trimmed() << "|\n";
    }
}

} // namespace

void print_snapshot(std::ostream &out, const DebugSnapshot &snapshot) {
    out << describe(snapshot.position);
    if (snapshot.paused_at_breakpoint) {
        out << " (breakpoint)";
    }
    out << '\n';

    if (pipe_point_of(snapshot.position).has_value()) {
        out << "in flight: " << count_of(snapshot.in_flight.size()) << '\n';
        print_records(out, snapshot.in_flight);
    }

    for (const auto &watch : snapshot.watches) {
        if (!watch.reached) {
            out << std::format("{} @ {}: not yet reached\n", watch.label, watch.pipe_point);
            continue;
        }

        out << std::format("{} @ {}: {}\n", watch.label, watch.pipe_point, count_of(watch.records.size()));
        print_records(out, watch.records);
    }

    out << std::format(
        "output: {} so far, input: {}\n", count_of(snapshot.output.size()), count_of(snapshot.input_count));
    out.flush();
}

std::vector<std::string> split_words(std::string_view line) {
    std::vector<std::string> words;
    std::size_t position = 0;

    while (position < line.size()) {
        const auto first = line.find_first_not_of(" \t", position);
        if (first == std::string_view::npos) {
            break;
        }

        const auto last = std::min(line.find_first_of(" \t", first), line.size());
        words.emplace_back(line.substr(first, last - first));
        position = last;
    }

    return words;
}

DebuggerCommands::DebuggerCommands(DebugSession &session, HistoryManager &history_manager)
    : session_(session), history_manager_(history_manager) {
    register_commands();
}

bool DebuggerCommands::is_command(std::string_view command) const { return registry_.contains(std::string(command)); }

int DebuggerCommands::execute(
    std::string_view command, const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    auto it = registry_.find(std::string(command));
    if (it == registry_.end()) {
        err << command << ": unknown command (try 'help')" << std::endl;
        return 1;
    }

    return it->second(args, out, err);
}

std::vector<std::string> DebuggerCommands::names() const {
    std::vector<std::string> result;
    result.reserve(registry_.size());

    for (const auto &[name, _] : registry_) {
        result.push_back(name);
    }

    std::ranges::sort(result);
    return result;
}

std::vector<std::string> DebuggerCommands::argument_candidates(std::string_view command) const {
    std::vector<std::string> candidates;

    if (command == "unwatch") {
        for (const auto &watch : session_.watches()) {
            candidates.push_back(watch.label);
        }
    } else if (command == "clear") {
        for (const std::size_t pipe_point : session_.breakpoints()) {
            candidates.push_back(std::to_string(pipe_point));
        }
    } else if (command == "watch" || command == "break") {
        for (std::size_t pipe_point = 0; pipe_point <= session_.pipeline().stage_count(); ++pipe_point) {
            candidates.push_back(std::to_string(pipe_point));
        }
    }

    return candidates;
}

    return result;
}

bool DebuggerCommands::exit_requested() const noexcept { return exit_requested_; }

void DebuggerCommands::register_commands() {
    registry_["step"] = [this](const auto &args, auto &out, auto &err) { return command_step(args, out, err); };
    registry_["run"] = [this](const auto &args, auto &out, auto &err) { return command_run(args, out, err); };
    registry_["reset"] = [this](const auto &args, auto &out, auto &err) { return command_reset(args, out, err); };
    registry_["where"] = [this](const auto &args, auto &out, auto &err) { return command_where(args, out, err); };
    registry_["watch"] = [this](const auto &args, auto &out, auto &err) { return command_watch(args, out, err); };
    registry_["unwatch"] = [this](const auto &args, auto &out, auto &err) { return command_unwatch(args, out, err); };
    registry_["break"] = [this](const auto &args, auto &out, auto &err) { return command_break(args, out, err); };
    registry_["clear"] = [this](const auto &args, auto &out, auto &err) { return command_clear(args, out, err); };
    registry_["watches"] = [this](const auto &args, auto &out, auto &err) { return command_watches(args, out, err); };
    registry_["stages"] = [this](const auto &args, auto &out, auto &err) { return command_stages(args, out, err); };
    registry_["output"] = [this](const auto &args, auto &out, auto &err) { return command_output(args, out, err); };
    registry_["history"] = [this](const auto &args, auto &out, auto &err) { return command_history(args, out, err); };
    registry_["help"] = [this](const auto &args, auto &out, auto &err) { return command_help(args, out, err); };
    registry_["quit"] = [this](const auto &args, auto &out, auto &err) { return command_quit(args, out, err); };
    registry_["exit"] = [this](const auto &args, auto &out, auto &err) { return command_quit(args, out, err); };
}

int DebuggerCommands::command_step(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    std::size_t count = 1;
    if (!args.empty() && (!parse_number(args[0], count) || count == 0)) {
        err << "step: expected a positive count" << std::endl;
        return 1;
    }

    auto result = session_.step();
    for (std::size_t i = 1; i < count && result.has_value(); ++i) {
        if (std::holds_alternative<Finished>(result->position)) {
            break;
        }
        result = session_.step();
    }

    return report(result, out, err);
}

int DebuggerCommands::command_run(const std::vector<std::string> & /*args*/, std::ostream &out, std::ostream &err) {
    return report(session_.run_to_breakpoint(), out, err);
}

int DebuggerCommands::command_reset(const std::vector<std::string> & /*args*/, std::ostream &out, std::ostream &err) {
    return report(session_.reset(), out, err);
}

int DebuggerCommands::command_where(
    const std::vector<std::string> & /*args*/, std::ostream &out, std::ostream & /*err*/) {
    print_snapshot(out, session_.snapshot());
    return 0;
}

int DebuggerCommands::command_watch(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    std::size_t pipe_point = 0;
    if (args.empty() || !parse_number(args[0], pipe_point)) {
        err << "watch: expected a pipe point" << std::endl;
        return 1;
    }

    return report(session_.add_watch(pipe_point), out, err);
}

int DebuggerCommands::command_unwatch(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    if (args.empty()) {
        err << "unwatch: expected a watch label" << std::endl;
        return 1;
    }

    return report(session_.remove_watch(args[0]), out, err);
}

int DebuggerCommands::command_break(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    std::size_t pipe_point = 0;
    if (args.empty() || !parse_number(args[0], pipe_point)) {
        err << "break: expected a pipe point" << std::endl;
        return 1;
    }

    return report(session_.add_breakpoint(pipe_point), out, err);
}

int DebuggerCommands::command_clear(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    std::size_t pipe_point = 0;
    if (args.empty() || !parse_number(args[0], pipe_point)) {
        err << "clear: expected a pipe point" << std::endl;
        return 1;
    }

    return report(session_.remove_breakpoint(pipe_point), out, err);
}

int DebuggerCommands::command_watches(
    const std::vector<std::string> & /*args*/, std::ostream &out, std::ostream & /*err*/) {
    if (session_.watches().empty() && session_.breakpoints().empty()) {
        out << "no watches or breakpoints" << std::endl;
        return 0;
    }

    for (const auto &watch : session_.watches()) {
        out << std::format("{}  watch at pipe point {}\n", watch.label, watch.pipe_point);
    }
    for (const auto pipe_point : session_.breakpoints()) {
        out << std::format("    break at pipe point {}\n", pipe_point);
    }

    out.flush();
    return 0;
}

int DebuggerCommands::command_stages(
    const std::vector<std::string> & /*args*/, std::ostream &out, std::ostream & /*err*/) {
    const Pipeline &pipeline = session_.pipeline();

    for (std::size_t index = 0; index < pipeline.stages.size(); ++index) {
        const Command &command = pipeline.stages[index];
        out << std::format("  ({})\n", index);
        out << std::format("{:>3}  {}  [line {}]\n", index + 1, command.text, command.line);
    }
    out << std::format("  ({})\n", pipeline.stages.size());

    out.flush();
    return 0;
}

int DebuggerCommands::command_output(
    const std::vector<std::string> & /*args*/, std::ostream &out, std::ostream & /*err*/) {
    const DebugSnapshot snapshot = session_.snapshot();

    out << "output: " << count_of(snapshot.output.size()) << '\n';
    print_records(out, snapshot.output);

    out.flush();
    return 0;
}

int DebuggerCommands::command_history(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    int limit = history_length;
    if (!args.empty() && (!parse_number(args[0], limit) || limit < 0)) {
        err << "history: invalid numeric argument" << std::endl;
        return 1;
    }

    history_manager_.print(out, limit);
    return 0;
}

int DebuggerCommands::command_help(
    const std::vector<std::string> & /*args*/, std::ostream &out, std::ostream & /*err*/) {
    for (const auto &entry : help_entries) {
        out << std::format("  {:<14}{}\n", entry.usage, entry.summary);
    }

    out.flush();
    return 0;
}

int DebuggerCommands::command_quit(
    const std::vector<std::string> & /*args*/, std::ostream & /*out*/, std::ostream & /*err*/) {
    exit_requested_ = true;
    return 0;
}

int DebuggerCommands::report(const std::expected<DebugSnapshot, Error> &result, std::ostream &out, std::ostream &err) {
    if (!result.has_value()) {
        err << describe(result.error()) << std::endl;
        return 1;
    }

    print_snapshot(out, *result);
    return 0;
}

} // namespace cardpipe
