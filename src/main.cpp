#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "app/cli_options.hpp"
#include "app/debugger_app.hpp"
#include "app/run_app.hpp"

int main(int argc, char *argv[]) {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    const std::vector<std::string> args(argv + 1, argv + argc);

    auto options = cardpipe::parse_cli(args);
    if (!options.has_value()) {
        std::cerr << cardpipe::describe(options.error()) << '\n' << cardpipe::usage_text();
        return 2;
    }

    switch (options->command) {
    case cardpipe::CliCommand::Help:
        std::cout << cardpipe::usage_text();
        return 0;
    case cardpipe::CliCommand::Run:
        return cardpipe::RunApp(std::move(*options)).run();
    case cardpipe::CliCommand::Debug:
        return cardpipe::DebuggerApp::launch(*options);
    }

    return 2;
}
