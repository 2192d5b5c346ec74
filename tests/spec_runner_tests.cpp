#include <cassert>
#include <string>
#include <vector>

#include "core/command.hpp"
#include "core/parser.hpp"
#include "core/record.hpp"
#include "execution/spec_runner.hpp"
#include "io/memory_record_io.hpp"

using cardpipe::ErrorKind;
using cardpipe::ExecutionMode;
using cardpipe::FileEndpoint;
using cardpipe::MemoryRecordIo;
using cardpipe::Parser;
using cardpipe::PipelineSpec;
using cardpipe::Record;
using cardpipe::Records;
using cardpipe::SpecRunner;
using cardpipe::WriteMode;

namespace {

PipelineSpec spec_of(const std::string &text) {
    auto spec = Parser{}.parse(text);
    assert(spec.has_value());
    return *spec;
}

Records records_of(const std::vector<std::string> &lines) {
    Records records;
    for (const auto &line : lines) {
        records.push_back(Record::padded(line));
    }
    return records;
}

std::vector<std::string> texts_of(const Records &records) {
    std::vector<std::string> texts;
    for (const auto &record : records) {
        texts.emplace_back(record.trimmed());
    }
    return texts;
}

void test_run_batch_single_pipeline() {
    const auto spec = spec_of("PIPE CONSOLE\n| LOCATE /b/\n| UPPER\n| CONSOLE\n?\n");

    auto output = cardpipe::run_batch(records_of({"abc", "xyz", "bcd"}), spec);
    assert(output.has_value());
    assert(texts_of(*output) == (std::vector<std::string>{"ABC", "BCD"}));
}

void test_run_batch_without_io_rejects_files() {
    const auto spec = spec_of("< in.txt\n| UPPER\n");

    auto output = cardpipe::run_batch(records_of({"a"}), spec);
    assert(!output.has_value());
    assert(output.error().kind == ErrorKind::Io);
    assert(output.error().context == "in.txt");
}

void test_console_output_feeds_the_next_console_source() {
    const auto spec = spec_of("PIPE CONSOLE\n| UPPER\n| CONSOLE\n?\n"
                              "PIPE CONSOLE\n| DUPLICATE 2\n| COUNT\n| CONSOLE\n?\n");
    MemoryRecordIo io;

    auto result = SpecRunner(io).run(spec, records_of({"a", "b", "c"}));
    assert(result.has_value());
    assert(texts_of(result->output) == (std::vector<std::string>{"6"}));

    assert(result->reports.size() == 2);
    assert(result->reports[0].input_count == 3);
    assert(result->reports[0].output_count == 3);
    assert(result->reports[1].input_count == 3);
    assert(result->reports[1].output_count == 1);
}

void test_files_connect_pipelines() {
    const auto spec = spec_of("PIPE < staff.txt\n| FILTER 0,1 = \"A\"\n| > picked.txt\n?\n"
                              "PIPE < picked.txt\n| COUNT\n?\n");
    MemoryRecordIo io;
    io.put("staff.txt", records_of({"Ann", "Bob", "Abe"}));

    auto result = SpecRunner(io).run(spec, records_of({"ignored"}));
    assert(result.has_value());

    assert(texts_of(io.files().at("picked.txt")) == (std::vector<std::string>{"Ann", "Abe"}));
    assert(texts_of(result->output) == (std::vector<std::string>{"2"}));
    assert(result->reports[0].input_count == 3);
}

void test_unconsumed_console_output_is_collected() {
    const auto spec = spec_of("UPPER?\n"
                              "< other.txt\n| LOWER?\n");
    MemoryRecordIo io;
    io.put("other.txt", records_of({"MiXeD"}));

    auto result = SpecRunner(io).run(spec, records_of({"first"}));
    assert(result.has_value());
    assert(texts_of(result->output) == (std::vector<std::string>{"FIRST", "mixed"}));
}

void test_console_sources_fall_back_to_primary_input() {
    const auto spec = spec_of("UPPER\n| > upper.txt?\n"
                              "REVERSE?\n");
    MemoryRecordIo io;

    auto result = SpecRunner(io).run(spec, records_of({"abc"}));
    assert(result.has_value());
    assert(texts_of(io.files().at("upper.txt")) == (std::vector<std::string>{"ABC"}));
    assert(texts_of(result->output) == (std::vector<std::string>{"cba"}));
}

void test_append_sink_keeps_existing_records() {
    const auto spec = spec_of("CONSOLE\n| >> log.txt\n?\n");
    MemoryRecordIo io;
    io.put("log.txt", records_of({"old"}));

    auto result = SpecRunner(io).run(spec, records_of({"new"}));
    assert(result.has_value());
    assert(result->output.empty());
    assert(texts_of(io.files().at("log.txt")) == (std::vector<std::string>{"old", "new"}));

    auto truncating = SpecRunner(io).run(spec_of("CONSOLE\n| > log.txt\n?\n"), records_of({"only"}));
    assert(truncating.has_value());
    assert(texts_of(io.files().at("log.txt")) == (std::vector<std::string>{"only"}));
}

void test_execution_modes_agree() {
    const auto spec = spec_of("LITERAL \"H\"\n| TAKE 2\n| CONSOLE\n?\n"
                              "COUNT\n| LITERAL \"N\"\n?\n");
    MemoryRecordIo io;
    const Records input = records_of({"a", "b", "c"});

    auto batch = SpecRunner(io).run(spec, input, ExecutionMode::Batch);
    auto rat = SpecRunner(io).run(spec, input, ExecutionMode::RecordAtATime);
    assert(batch.has_value());
    assert(rat.has_value());
    assert(batch->output == rat->output);
    assert(texts_of(batch->output) == (std::vector<std::string>{"N", "2"}));
}

void test_input_for_runs_the_earlier_pipelines() {
    const auto spec = spec_of("UPPER?\n"
                              "TAKE 1?\n"
                              "< file.txt\n| COUNT?\n");
    MemoryRecordIo io;
    io.put("file.txt", records_of({"f1", "f2"}));
    SpecRunner runner(io);

    auto first = runner.input_for(spec, records_of({"a", "b"}), 0);
    assert(first.has_value());
    assert(texts_of(*first) == (std::vector<std::string>{"a", "b"}));

    auto second = runner.input_for(spec, records_of({"a", "b"}), 1);
    assert(second.has_value());
    assert(texts_of(*second) == (std::vector<std::string>{"A", "B"}));

    auto third = runner.input_for(spec, records_of({"a", "b"}), 2);
    assert(third.has_value());
    assert(texts_of(*third) == (std::vector<std::string>{"f1", "f2"}));

    auto missing = runner.input_for(spec, records_of({"a"}), 3);
    assert(!missing.has_value());
    assert(missing.error().kind == ErrorKind::Usage);
}

void test_memory_io_falls_back_to_backing() {
    MemoryRecordIo disk;
    disk.put("seed.txt", records_of({"s"}));

    MemoryRecordIo overlay(&disk);
    const FileEndpoint seed{.path = "seed.txt", .mode = WriteMode::Append};

    auto read = overlay.read(seed);
    assert(read.has_value());
    assert(texts_of(*read) == (std::vector<std::string>{"s"}));

    assert(overlay.write(seed, records_of({"t"})).has_value());
    assert(texts_of(overlay.files().at("seed.txt")) == (std::vector<std::string>{"s", "t"}));
    assert(texts_of(disk.files().at("seed.txt")) == (std::vector<std::string>{"s"}));

    auto missing = overlay.read(FileEndpoint{.path = "none.txt", .mode = WriteMode::Truncate});
    assert(!missing.has_value());
    assert(missing.error().kind == ErrorKind::Io);
}

} // namespace

int main() {
    test_run_batch_single_pipeline();
    test_run_batch_without_io_rejects_files();
    test_console_output_feeds_the_next_console_source();
    test_files_connect_pipelines();
    test_unconsumed_console_output_is_collected();
    test_console_sources_fall_back_to_primary_input();
    test_append_sink_keeps_existing_records();
    test_execution_modes_agree();
    test_input_for_runs_the_earlier_pipelines();
    test_memory_io_falls_back_to_backing();

    return 0;
}
