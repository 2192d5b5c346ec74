#include "history/history_manager.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <format>
#include <ostream>
#include <string_view>
#include <system_error>

#include <readline/history.h>

namespace cardpipe {

namespace {

[[nodiscard]] int history_size_from_env() {
    const char *value = std::getenv("CARDPIPE_HISTSIZE");
    if (value == nullptr) {
        return HistoryManager::default_history_size;
    }

    const std::string_view text(value);
    int size = 0;
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), size);
    if (error != std::errc{} || end != text.data() + text.size() || size < 0) {
        return HistoryManager::default_history_size;
    }

    return size;
}

[[nodiscard]] bool is_blank(const std::string &input) { return input.find_first_not_of(" \t") == std::string::npos; }

} // namespace

void HistoryManager::initialize() {
    using_history();

    const char *histfile_env = std::getenv("CARDPIPE_HISTFILE");
    const char *home = std::getenv("HOME");

    history_file_path_ = histfile_env != nullptr ? std::string(histfile_env)
                                                 : std::string(home != nullptr ? home : "") + "/.cardpipe_history";
    history_size_ = history_size_from_env();

    stifle_history(history_size_);
    read_history(history_file_path_.c_str());
}

bool HistoryManager::save() const {
    if (write_history(history_file_path_.c_str()) != 0) {
        return false;
    }

    return history_truncate_file(history_file_path_.c_str(), history_size_) == 0;
}

// Blank lines and immediate repeats are not recorded.
void HistoryManager::record_input(const std::string &input) const {
    if (is_blank(input)) {
        return;
    }

    if (history_length > 0) {
        const HIST_ENTRY *last_entry = history_get(history_base + history_length - 1);
        if (last_entry != nullptr && std::strcmp(input.c_str(), last_entry->line) == 0) {
            return;
        }
    }

    add_history(input.c_str());
}

void HistoryManager::print(std::ostream &out, int limit) const {
    const int count = std::clamp(limit, 0, history_length);

    for (int i = history_length - count; i < history_length; ++i) {
        const HIST_ENTRY *entry = history_get(history_base + i);
        if (entry != nullptr) {
            out << std::format("{:>5}  {}\n", history_base + i, entry->line);
        }
    }
    out.flush();
}

} // namespace cardpipe
