#pragma once

#include <iosfwd>
#include <string>

namespace cardpipe {

// Debugger command history, persisted across sessions through readline.
// CARDPIPE_HISTFILE names the file and CARDPIPE_HISTSIZE caps the number of
// entries kept in memory and on disk.
class HistoryManager {
  public:
    static constexpr int default_history_size = 500;

    void initialize();
    // False when the history file cannot be written.
    [[nodiscard]] bool save() const;
    void record_input(const std::string &input) const;

    void print(std::ostream &out, int limit) const;

    [[nodiscard]] const std::string &history_file_path() const noexcept { return history_file_path_; }
    [[nodiscard]] int history_size() const noexcept { return history_size_; }

  private:
    std::string history_file_path_;
    int history_size_{default_history_size};
};

} // namespace cardpipe
