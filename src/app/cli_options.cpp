#include "app/cli_options.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include "core/parser.hpp"
#include "io/record_file.hpp"

namespace cardpipe {

namespace {

[[nodiscard]] std::expected<std::size_t, Error> parse_pipeline_number(const std::string &token) {
    std::size_t number = 0;
    const char *first = token.data();
    const char *last = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(first, last, number);

    if (ec != std::errc{} || ptr != last || number == 0) {
        return std::unexpected(usage_error(std::format("--pipeline expects a number from 1, got '{}'", token)));
    }

    return number - 1;
}

} // namespace

std::string_view usage_text() noexcept {
    return "usage:\n"
           "  cardpipe run <pipeline-file> <input-file> [-o <output-file>] [--rat] [--verify]\n"
           "  cardpipe debug <pipeline-file> <input-file> [--pipeline N]\n"
           "  cardpipe help\n"
           "\n"
           "<input-file> may be '-' for standard input (run only).\n";
}

std::expected<CliOptions, Error> parse_cli(std::span<const std::string> args) {
    CliOptions options;

    if (args.empty() || args[0] == "help" || args[0] == "--help" || args[0] == "-h") {
        return options;
    }

    const std::string &command = args[0];
    if (command == "run") {
        options.command = CliCommand::Run;
    } else if (command == "debug") {
        options.command = CliCommand::Debug;
    } else {
        return std::unexpected(usage_error(std::format("unknown command '{}'", command)));
    }

    std::vector<std::string> positional;
    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string &arg = args[i];

        if (options.command == CliCommand::Run && arg == "-o") {
            if (i + 1 >= args.size()) {
                return std::unexpected(usage_error("-o requires a file argument"));
            }
            options.output_path = args[++i];
        } else if (options.command == CliCommand::Run && arg == "--rat") {
            options.mode = ExecutionMode::RecordAtATime;
        } else if (options.command == CliCommand::Run && arg == "--verify") {
            options.verify = true;
        } else if (options.command == CliCommand::Debug && arg == "--pipeline") {
            if (i + 1 >= args.size()) {
                return std::unexpected(usage_error("--pipeline requires a number"));
            }
            auto index = parse_pipeline_number(args[++i]);
            if (!index.has_value()) {
                return std::unexpected(index.error());
            }
            options.pipeline_index = *index;
        } else if (arg.size() > 1 && arg.starts_with('-')) {
            return std::unexpected(usage_error(std::format("{}: unknown option '{}'", command, arg)));
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        return std::unexpected(usage_error(std::format("{} expects <pipeline-file> <input-file>", command)));
    }

    options.pipeline_path = positional[0];
    options.input_path = positional[1];

    if (options.command == CliCommand::Debug && options.input_path == stdin_path) {
        return std::unexpected(usage_error("debug reads commands from the terminal, so its input must be a file"));
    }

    return options;
}

std::expected<PipelineSpec, Error> load_spec(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(io_error(path, "cannot open pipeline file"));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto spec = Parser{}.parse(buffer.str());
    if (!spec.has_value()) {
        Error error = std::move(spec.error());
        if (error.context.empty()) {
            error.context = path;
        }
        return std::unexpected(std::move(error));
    }

    return spec;
}

std::expected<Records, Error> load_input(const std::string &path) {
    if (path == stdin_path) {
        return read_records(std::cin, "<stdin>");
    }

    return FileRecordIo::read_file(path);
}

} // namespace cardpipe
