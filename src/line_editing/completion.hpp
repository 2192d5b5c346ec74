#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cardpipe {

class DebuggerCommands;

// Tab completion for the debugger prompt: command names for the first word,
// watch labels and pipe points for the argument.
class CompletionEngine {
  public:
    explicit CompletionEngine(const DebuggerCommands &commands);

    void install();

  private:
    const DebuggerCommands &commands_;
    std::vector<std::string> matches_;
    std::size_t next_match_{0};

    static CompletionEngine *instance_;

    static char **completion_callback(const char *text, int start, int end);
    static char *generator_callback(const char *text, int state);

    // `before` is the line up to the word being completed.
    [[nodiscard]] std::vector<std::string> collect_matches(std::string_view before, std::string_view prefix) const;
};

} // namespace cardpipe
