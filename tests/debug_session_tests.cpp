#include <cassert>
#include <set>
#include <string>
#include <vector>

#include "core/command.hpp"
#include "core/parser.hpp"
#include "core/record.hpp"
#include "debugger/debug_session.hpp"
#include "execution/spec_runner.hpp"
#include "io/memory_record_io.hpp"

using cardpipe::AtFlush;
using cardpipe::AtPipePoint;
using cardpipe::CursorPosition;
using cardpipe::DebugSession;
using cardpipe::DebugSnapshot;
using cardpipe::ErrorKind;
using cardpipe::Finished;
using cardpipe::NotStarted;
using cardpipe::Parser;
using cardpipe::Pipeline;
using cardpipe::Record;
using cardpipe::Records;

namespace {

Pipeline pipeline_of(const std::string &text) {
    auto spec = Parser{}.parse(text);
    assert(spec.has_value());
    return spec->pipelines.front();
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

DebugSnapshot ok(const std::expected<DebugSnapshot, cardpipe::Error> &result) {
    assert(result.has_value());
    return *result;
}

CursorPosition at(std::size_t record_index, std::size_t pipe_point) {
    return AtPipePoint{.record_index = record_index, .pipe_point = pipe_point};
}

void test_initialize_and_step() {
    DebugSession session(pipeline_of("UPPER\n| TAKE 1\n"), records_of({"a", "b"}));

    const auto fresh = session.snapshot();
    assert(std::holds_alternative<NotStarted>(fresh.position));
    assert(fresh.stage_count == 2);
    assert(fresh.input_count == 2);

    auto first = ok(session.step());
    assert(first.position == at(0, 0));
    assert(texts_of(first.in_flight) == (std::vector<std::string>{"a"}));

    assert(ok(session.initialize()).position == at(0, 0));

    assert(ok(session.step()).position == at(0, 1));
    assert(ok(session.step()).position == at(0, 2));
    assert(ok(session.step()).position == at(1, 0));

    auto blocked = ok(session.step());
    blocked = ok(session.step());
    assert(blocked.position == at(1, 2));
    assert(blocked.in_flight.empty());
    assert(texts_of(blocked.output) == (std::vector<std::string>{"A"}));

    assert(std::holds_alternative<Finished>(ok(session.step()).position));
    assert(std::holds_alternative<Finished>(ok(session.step()).position));
}

void test_step_traversal_matches_run_batch() {
    const std::string text = "FILTER 0,1 != \"b\"\n| DUPLICATE 2\n| COUNT\n| LITERAL \"done\"\n";
    const Records input = records_of({"a", "b", "c"});
    DebugSession session(pipeline_of(text), input);

    std::size_t observations = 0;
    bool reached_flush = false;
    auto snapshot = ok(session.step());

    while (!std::holds_alternative<Finished>(snapshot.position)) {
        if (std::holds_alternative<AtFlush>(snapshot.position)) {
            reached_flush = true;
        } else {
            assert(!reached_flush);
            ++observations;
        }
        snapshot = ok(session.step());
    }

    assert(observations == input.size() * (4 + 1));

    auto spec = Parser{}.parse(text);
    assert(spec.has_value());
    auto expected = cardpipe::run_batch(input, *spec);
    assert(expected.has_value());
    assert(snapshot.output == *expected);
    assert(texts_of(snapshot.output) == (std::vector<std::string>{"done", "4"}));
}

void test_run_stops_at_breakpoints_and_step_ignores_them() {
    DebugSession session(pipeline_of("UPPER\n| LOWER\n| REVERSE\n"), records_of({"ab", "cd"}));

    ok(session.add_breakpoint(2));

    auto paused = ok(session.run_to_breakpoint());
    assert(paused.position == at(0, 2));
    assert(paused.paused_at_breakpoint);

    auto stepped = ok(session.step());
    assert(stepped.position == at(0, 3));
    assert(!stepped.paused_at_breakpoint);

    assert(ok(session.step()).position == at(1, 0));
    assert(ok(session.step()).position == at(1, 1));
    assert(ok(session.step()).position == at(1, 2));

    auto finished = ok(session.run_to_breakpoint());
    assert(std::holds_alternative<Finished>(finished.position));
    assert(!finished.paused_at_breakpoint);
    assert(texts_of(finished.output) == (std::vector<std::string>{"ba", "dc"}));
}

void test_run_moves_off_a_breakpoint_before_checking() {
    DebugSession session(pipeline_of("UPPER\n"), records_of({"x", "y"}));
    ok(session.add_breakpoint(0));

    auto first = ok(session.run_to_breakpoint());
    assert(first.position == at(0, 0));
    assert(first.paused_at_breakpoint);

    auto second = ok(session.run_to_breakpoint());
    assert(second.position == at(1, 0));
    assert(second.paused_at_breakpoint);
}

void test_breakpoints_fire_inside_the_flush_phase() {
    DebugSession session(pipeline_of("COUNT\n| UPPER\n"), records_of({"a"}));
    ok(session.add_breakpoint(2));

    auto record_arrival = ok(session.run_to_breakpoint());
    assert(record_arrival.position == at(0, 2));

    auto flush_arrival = ok(session.run_to_breakpoint());
    assert(flush_arrival.position == CursorPosition(AtFlush{.flush_index = 0, .stage_index = 0, .pipe_point = 2}));
    assert(texts_of(flush_arrival.in_flight) == (std::vector<std::string>{"1"}));
}

void test_watches_report_the_current_journey() {
    DebugSession session(pipeline_of("UPPER\n| DUPLICATE 2\n| COUNT\n"), records_of({"a"}));

    auto added = ok(session.add_watch(2));
    assert(added.watches.size() == 1);
    assert(added.watches.front().label == "w1");
    assert(!added.watches.front().reached);

    ok(session.add_watch(0));

    ok(session.step());
    auto at_one = ok(session.step());
    assert(at_one.watches[0].label == "w1");
    assert(!at_one.watches[0].reached);
    assert(at_one.watches[1].label == "w2");
    assert(at_one.watches[1].reached);
    assert(texts_of(at_one.watches[1].records) == (std::vector<std::string>{"a"}));

    auto at_two = ok(session.step());
    assert(at_two.watches[0].reached);
    assert(texts_of(at_two.watches[0].records) == (std::vector<std::string>{"A", "A"}));

    ok(session.step());
    auto flush = ok(session.step());
    assert(std::holds_alternative<AtFlush>(flush.position));
    assert(!flush.watches[0].reached);
    assert(!flush.watches[1].reached);

    ok(session.remove_watch("w1"));
    auto remaining = session.snapshot();
    assert(remaining.watches.size() == 1);
    assert(remaining.watches.front().label == "w2");

    auto unknown = session.remove_watch("w1");
    assert(!unknown.has_value());
    assert(unknown.error().kind == ErrorKind::Usage);

    assert(ok(session.add_watch(1)).watches.back().label == "w3");
}

void test_positions_outside_the_pipeline_are_rejected() {
    DebugSession session(pipeline_of("UPPER\n| LOWER\n"), records_of({"a"}));

    assert(session.add_watch(2).has_value());
    assert(session.add_breakpoint(0).has_value());

    auto watch = session.add_watch(3);
    assert(!watch.has_value());
    assert(watch.error().kind == ErrorKind::Usage);

    auto breakpoint = session.add_breakpoint(3);
    assert(!breakpoint.has_value());
    assert(breakpoint.error().kind == ErrorKind::Usage);

    assert(!session.remove_breakpoint(1).has_value());
    assert(session.remove_breakpoint(0).has_value());
    assert(session.breakpoints().empty());
}

void test_reset_keeps_watches_and_breakpoints() {
    DebugSession session(pipeline_of("TAKE 1\n| UPPER\n"), records_of({"a", "b"}));
    ok(session.add_watch(1));
    ok(session.add_breakpoint(1));

    auto paused = ok(session.run_to_breakpoint());
    assert(paused.paused_at_breakpoint);
    ok(session.step());
    ok(session.step());

    auto reset = ok(session.reset());
    assert(reset.position == at(0, 0));
    assert(!reset.paused_at_breakpoint);
    assert(reset.output.empty());
    assert(reset.watches.size() == 1);
    assert(!reset.watches.front().reached);
    assert(session.breakpoints().contains(1));

    auto finished = ok(session.run_to_breakpoint());
    finished = ok(session.run_to_breakpoint());
    finished = ok(session.run_to_breakpoint());
    assert(std::holds_alternative<Finished>(finished.position));
    assert(texts_of(finished.output) == (std::vector<std::string>{"A"}));
}

void test_reset_with_empty_input() {
    DebugSession plain(pipeline_of("UPPER\n"), {});
    assert(std::holds_alternative<Finished>(ok(plain.reset()).position));

    DebugSession counting(pipeline_of("COUNT\n"), {});
    auto flush = ok(counting.reset());
    assert(flush.position == CursorPosition(AtFlush{.flush_index = 0, .stage_index = 0, .pipe_point = 1}));
    assert(texts_of(flush.in_flight) == (std::vector<std::string>{"0"}));
}

void test_reinitialize_drops_out_of_range_positions() {
    DebugSession session(pipeline_of("UPPER\n| LOWER\n| REVERSE\n"), records_of({"a"}));
    ok(session.add_watch(1));
    ok(session.add_watch(3));
    ok(session.add_breakpoint(2));
    ok(session.add_breakpoint(3));

    auto snapshot = ok(session.reinitialize(pipeline_of("UPPER\n| LOWER\n"), records_of({"x", "y"})));
    assert(snapshot.stage_count == 2);
    assert(snapshot.input_count == 2);
    assert(snapshot.position == at(0, 0));

    assert(session.watches().size() == 1);
    assert(session.watches().front().pipe_point == 1);
    assert(session.breakpoints() == (std::set<std::size_t>{2}));
}

void test_open_resolves_the_input_of_a_later_pipeline() {
    auto spec = Parser{}.parse("UPPER?\nREVERSE\n| COUNT?\n");
    assert(spec.has_value());
    cardpipe::MemoryRecordIo io;

    auto session = DebugSession::open(*spec, records_of({"ab"}), 1, io);
    assert(session.has_value());
    assert(session->pipeline().stage_count() == 2);

    auto first = ok(session->step());
    assert(texts_of(first.in_flight) == (std::vector<std::string>{"AB"}));

    auto missing = DebugSession::open(*spec, records_of({"ab"}), 2, io);
    assert(!missing.has_value());
    assert(missing.error().kind == ErrorKind::Usage);
}

void test_open_leaves_the_files_of_earlier_pipelines_alone() {
    auto spec = Parser{}.parse("UPPER\n| >> log.txt\n?\n"
                               "< log.txt\n| COUNT\n?\n");
    assert(spec.has_value());

    cardpipe::MemoryRecordIo disk;
    disk.put("log.txt", records_of({"old"}));

    auto session = DebugSession::open(*spec, records_of({"new", "newer"}), 1, disk);
    assert(session.has_value());
    assert(texts_of(disk.files().at("log.txt")) == (std::vector<std::string>{"old"}));

    auto first = ok(session->step());
    assert(first.input_count == 3);
    assert(texts_of(first.in_flight) == (std::vector<std::string>{"old"}));

    auto again = DebugSession::open(*spec, records_of({"new"}), 1, disk);
    assert(again.has_value());
    assert(texts_of(disk.files().at("log.txt")) == (std::vector<std::string>{"old"}));
}

} // namespace

int main() {
    test_initialize_and_step();
    test_step_traversal_matches_run_batch();
    test_run_stops_at_breakpoints_and_step_ignores_them();
    test_run_moves_off_a_breakpoint_before_checking();
    test_breakpoints_fire_inside_the_flush_phase();
    test_watches_report_the_current_journey();
    test_positions_outside_the_pipeline_are_rejected();
    test_reset_keeps_watches_and_breakpoints();
    test_reset_with_empty_input();
    test_reinitialize_drops_out_of_range_positions();
    test_open_resolves_the_input_of_a_later_pipeline();
    test_open_leaves_the_files_of_earlier_pipelines_alone();

    return 0;
}
