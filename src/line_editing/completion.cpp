#include "line_editing/completion.hpp"

#include <cstring>

#include <readline/readline.h>

#include "debugger/debugger_commands.hpp"

namespace cardpipe {

CompletionEngine *CompletionEngine::instance_ = nullptr;

CompletionEngine::CompletionEngine(const DebuggerCommands &commands) : commands_(commands) {}

void CompletionEngine::install() {
    instance_ = this;
    rl_attempted_completion_function = &CompletionEngine::completion_callback;
}

char **CompletionEngine::completion_callback(const char *text, int start, int /*end*/) {
    rl_attempted_completion_over = 1;

    if (instance_ == nullptr || rl_line_buffer == nullptr) {
        return nullptr;
    }

    instance_->matches_ = instance_->collect_matches(std::string_view(rl_line_buffer, start), text);
    instance_->next_match_ = 0;
    if (instance_->matches_.empty()) {
        return nullptr;
    }

    return rl_completion_matches(text, &CompletionEngine::generator_callback);
}

char *CompletionEngine::generator_callback(const char * /*text*/, int state) {
    if (instance_ == nullptr) {
        return nullptr;
    }

    if (state == 0) {
        instance_->next_match_ = 0;
    }

    if (instance_->next_match_ >= instance_->matches_.size()) {
        return nullptr;
    }

    return ::strdup(instance_->matches_[instance_->next_match_++].c_str());
}

std::vector<std::string> CompletionEngine::collect_matches(std::string_view before, std::string_view prefix) const {
    const auto words = split_words(before);

    std::vector<std::string> candidates;
    if (words.empty()) {
        candidates = commands_.names();
    } else if (words.size() == 1) {
        candidates = commands_.argument_candidates(words.front());
    }

    std::erase_if(candidates, [prefix](const std::string &candidate) { return !candidate.starts_with(prefix); });
    return candidates;
}

} // namespace cardpipe
