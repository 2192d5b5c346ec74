#pragma once

#include <string>

#include "app/cli_options.hpp"
#include "io/record_file.hpp"

namespace cardpipe {

// `cardpipe run`: executes every pipeline of a pipeline file and writes the
// console output to stdout or to the -o file.
class RunApp {
  public:
    explicit RunApp(CliOptions options);

    int run();

  private:
    CliOptions options_;
    FileRecordIo io_;

    [[nodiscard]] std::expected<Records, Error> rehearse(const PipelineSpec &spec, const Records &input);
    // Creates missing parent directories of the -o file before truncating it.
    [[nodiscard]] static std::expected<void, Error> write_output(const std::string &path, const Records &records);
    static void report(const RunResult &result);
};

} // namespace cardpipe
