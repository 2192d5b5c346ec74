#include "app/debugger_app.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <string>
#include <utility>

#include <readline/readline.h>

#include "io/record_file.hpp"

namespace cardpipe {

DebuggerApp::DebuggerApp(DebugSession session)
    : session_(std::move(session)),
      history_manager_(),
      commands_(session_, history_manager_),
      completion_engine_(commands_) {}

int DebuggerApp::launch(const CliOptions &options) {
    auto spec = load_spec(options.pipeline_path);
    if (!spec.has_value()) {
        std::cerr << describe(spec.error()) << std::endl;
        return 1;
    }

    auto input = load_input(options.input_path);
    if (!input.has_value()) {
        std::cerr << describe(input.error()) << std::endl;
        return 1;
    }

    FileRecordIo io;
    auto session = DebugSession::open(*spec, *input, options.pipeline_index, io);
    if (!session.has_value()) {
        std::cerr << describe(session.error()) << std::endl;
        return session.error().kind == ErrorKind::Usage ? 2 : 1;
    }

    DebuggerApp app(std::move(*session));
    return app.run();
}

int DebuggerApp::run() {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    completion_engine_.install();
    history_manager_.initialize();

    const DebugSnapshot initial = session_.snapshot();
    std::cout << std::format(
                     "{} stages, {} input records; pipe points are 0..{}. Type 'help' for commands.",
                     initial.stage_count,
                     initial.input_count,
                     initial.stage_count)
              << std::endl;

    while (true) {
        char *line = readline("(cardpipe) ");
        if (line == nullptr) {
            std::cout << std::endl;
            break;
        }

        std::string input(line);
        std::free(line);

        history_manager_.record_input(input);

        const auto words = split_words(input);
        if (words.empty()) {
            continue;
        }

        const std::vector<std::string> args(words.begin() + 1, words.end());
        commands_.execute(words.front(), args, std::cout, std::cerr);

        if (commands_.exit_requested()) {
            break;
        }
    }

    if (!history_manager_.save()) {
        std::cerr << std::format("history: cannot write {}", history_manager_.history_file_path()) << std::endl;
    }
    return 0;
}

} // namespace cardpipe
