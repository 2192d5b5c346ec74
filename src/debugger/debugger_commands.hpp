#pragma once

#include <expected>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/error.hpp"
#include "debugger/debug_session.hpp"

namespace cardpipe {

class HistoryManager;

void print_snapshot(std::ostream &out, const DebugSnapshot &snapshot);

// Whitespace-separated words of one debugger input line.
[[nodiscard]] std::vector<std::string> split_words(std::string_view line);

class DebuggerCommands {
  public:
    using CommandFunc = std::function<int(const std::vector<std::string> &, std::ostream &, std::ostream &)>;

    DebuggerCommands(DebugSession &session, HistoryManager &history_manager);

    [[nodiscard]] bool is_command(std::string_view command) const;
    int execute(std::string_view command, const std::vector<std::string> &args, std::ostream &out, std::ostream &err);

    // Command names, sorted.
    [[nodiscard]] std::vector<std::string> names() const;
    // Values the command accepts as its argument: watch labels for unwatch,
    // breakpoint positions for clear, every pipe point for watch and break.
    [[nodiscard]] std::vector<std::string> argument_candidates(std::string_view command) const;
    [[nodiscard]] bool exit_requested() const noexcept;

  private:
    DebugSession &session_;
    HistoryManager &history_manager_;
    bool exit_requested_{false};
    std::unordered_map<std::string, CommandFunc> registry_;

    void register_commands();

    int command_step(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_run(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_reset(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_where(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_watch(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_unwatch(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_break(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_clear(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_watches(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_stages(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_output(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_history(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_help(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int command_quit(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);

    static int report(const std::expected<DebugSnapshot, Error> &result, std::ostream &out, std::ostream &err);
};

} // namespace cardpipe
