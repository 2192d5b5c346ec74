#pragma once

#include "app/cli_options.hpp"
#include "debugger/debug_session.hpp"
#include "debugger/debugger_commands.hpp"
#include "history/history_manager.hpp"
#include "line_editing/completion.hpp"

namespace cardpipe {

// `cardpipe debug`: interactive stepping through one pipeline of a
// pipeline file.
class DebuggerApp {
  public:
    explicit DebuggerApp(DebugSession session);

    DebuggerApp(const DebuggerApp &) = delete;
    DebuggerApp &operator=(const DebuggerApp &) = delete;

    int run();

    static int launch(const CliOptions &options);

  private:
    DebugSession session_;
    HistoryManager history_manager_;
    DebuggerCommands commands_;
    CompletionEngine completion_engine_;
};

} // namespace cardpipe
