#include <cassert>
#include <string>
#include <vector>

#include "core/command.hpp"
#include "core/parser.hpp"
#include "core/record.hpp"
#include "core/stage.hpp"

using cardpipe::Command;
using cardpipe::ErrorKind;
using cardpipe::Parser;
using cardpipe::Record;
using cardpipe::Records;
using cardpipe::Stage;

namespace {

Command command_of(const std::string &text) {
    auto spec = Parser{}.parse(text);
    assert(spec.has_value());
    assert(spec->pipelines.size() == 1);
    assert(spec->pipelines.front().stages.size() == 1);
    return spec->pipelines.front().stages.front();
}

std::vector<std::string> texts_of(const Records &records) {
    std::vector<std::string> texts;
    for (const auto &record : records) {
        texts.emplace_back(record.trimmed());
    }
    return texts;
}

std::vector<std::string> step_all(Stage &stage, const std::vector<std::string> &lines) {
    std::vector<std::string> texts;
    for (const auto &line : lines) {
        auto produced = stage.step(Record::padded(line));
        assert(produced.has_value());
        for (const auto &text : texts_of(*produced)) {
            texts.push_back(text);
        }
    }
    return texts;
}

void test_filter_compares_trimmed_field() {
    auto stage = cardpipe::make_stage(command_of("FILTER 5,6 = \"SALES\""));

    const auto kept = step_all(*stage, {"ANN  SALES ", "BOB  IT", "CAT   SALES", "DAN  SALESX"});
    assert(kept == (std::vector<std::string>{"ANN  SALES", "CAT   SALES"}));

    auto negated = cardpipe::make_stage(command_of("FILTER 5,6 != \"SALES\""));
    const auto others = step_all(*negated, {"ANN  SALES", "BOB  IT"});
    assert(others == (std::vector<std::string>{"BOB  IT"}));
}

void test_locate_whole_record_and_field() {
    auto anywhere = cardpipe::make_stage(command_of("LOCATE /ERR/"));
    assert(step_all(*anywhere, {"ok", "ERR: disk", "an ERROR"}) == (std::vector<std::string>{"ERR: disk", "an ERROR"}));

    auto in_field = cardpipe::make_stage(command_of("LOCATE 0,3 /ERR/"));
    assert(step_all(*in_field, {"ERR: disk", "an ERROR"}) == (std::vector<std::string>{"ERR: disk"}));

    auto negated = cardpipe::make_stage(command_of("NLOCATE /ERR/"));
    assert(negated->name() == "NLOCATE");
    assert(step_all(*negated, {"ok", "ERR: disk"}) == (std::vector<std::string>{"ok"}));
}

void test_change_replaces_every_occurrence() {
    auto stage = cardpipe::make_stage(command_of("CHANGE /a/xyz/"));

    assert(step_all(*stage, {"banana"}) == (std::vector<std::string>{"bxyznxyznxyz"}));
    assert(step_all(*stage, {"none"}) == (std::vector<std::string>{"none"}));
}

void test_change_result_is_truncated_to_width() {
    auto stage = cardpipe::make_stage(command_of("CHANGE /x/xxxx/"));

    auto produced = stage->step(Record::padded(std::string(40, 'x')));
    assert(produced.has_value());
    assert(produced->size() == 1);
    assert(produced->front().text() == std::string(cardpipe::record_width, 'x'));
}

void test_select_builds_a_fresh_record() {
    auto stage = cardpipe::make_stage(command_of("SELECT 10,5; 0,4,20"));

    const auto selected = step_all(*stage, {"JOHN      SALES     rest"});
    assert(selected == (std::vector<std::string>{"SALES               JOHN"}));
}

void test_case_and_reverse() {
    auto upper = cardpipe::make_stage(command_of("UPPER"));
    assert(step_all(*upper, {"Hello, World 1"}) == (std::vector<std::string>{"HELLO, WORLD 1"}));

    auto lower = cardpipe::make_stage(command_of("LOWER"));
    assert(step_all(*lower, {"Hello, World 1"}) == (std::vector<std::string>{"hello, world 1"}));

    auto reverse = cardpipe::make_stage(command_of("REVERSE"));
    assert(step_all(*reverse, {"abc def"}) == (std::vector<std::string>{"fed cba"}));
    assert(step_all(*reverse, {"  ab"}) == (std::vector<std::string>{"ba"}));
}

void test_take_and_skip_count_across_calls() {
    auto take = cardpipe::make_stage(command_of("TAKE 2"));
    assert(step_all(*take, {"1", "2", "3", "4"}) == (std::vector<std::string>{"1", "2"}));

    auto skip = cardpipe::make_stage(command_of("SKIP 2"));
    assert(step_all(*skip, {"1", "2", "3", "4"}) == (std::vector<std::string>{"3", "4"}));

    auto take_none = cardpipe::make_stage(command_of("TAKE 0"));
    assert(step_all(*take_none, {"1"}).empty());
}

void test_duplicate_and_hole() {
    auto twice = cardpipe::make_stage(command_of("DUPLICATE"));
    assert(step_all(*twice, {"a"}) == (std::vector<std::string>{"a", "a"}));

    auto thrice = cardpipe::make_stage(command_of("DUPLICATE 3"));
    assert(step_all(*thrice, {"a", "b"}) == (std::vector<std::string>{"a", "a", "a", "b", "b", "b"}));

    auto none = cardpipe::make_stage(command_of("DUPLICATE 0"));
    assert(step_all(*none, {"a"}).empty());

    auto hole = cardpipe::make_stage(command_of("HOLE"));
    assert(step_all(*hole, {"a", "b"}).empty());
    assert(hole->end_of_input().empty());
    assert(!hole->flushes());
}

void test_count_flushes_the_total() {
    auto count = cardpipe::make_stage(command_of("COUNT"));
    assert(count->flushes());
    assert(step_all(*count, {"a", "b", "c"}).empty());
    assert(texts_of(count->end_of_input()) == (std::vector<std::string>{"3"}));

    auto empty = cardpipe::make_stage(command_of("COUNT"));
    assert(texts_of(empty->end_of_input()) == (std::vector<std::string>{"0"}));
}

void test_literal_emits_exactly_once() {
    auto literal = cardpipe::make_stage(command_of("LITERAL \"HEADER\""));
    assert(step_all(*literal, {"a", "b"}) == (std::vector<std::string>{"HEADER", "a", "b"}));
    assert(literal->end_of_input().empty());

    auto unused = cardpipe::make_stage(command_of("LITERAL \"HEADER\""));
    assert(texts_of(unused->end_of_input()) == (std::vector<std::string>{"HEADER"}));
}

void test_stage_chain_is_fresh_per_call() {
    auto spec = Parser{}.parse("TAKE 1\n| COUNT\n");
    assert(spec.has_value());

    auto first = cardpipe::make_stage_chain(spec->pipelines.front());
    auto second = cardpipe::make_stage_chain(spec->pipelines.front());
    assert(first.size() == 2);

    assert(step_all(*first[0], {"a", "b"}) == (std::vector<std::string>{"a"}));
    assert(step_all(*second[0], {"c"}) == (std::vector<std::string>{"c"}));
    assert(first[1]->name() == "COUNT");
}

void test_stage_failure_points_at_the_command() {
    Command command = command_of("UPPER\n");
    command.line = 7;

    const auto error = cardpipe::stage_failure(cardpipe::field_range_error(75, 10), command);
    assert(error.kind == ErrorKind::FieldRange);
    assert(error.line == 7);
    assert(error.context == "UPPER");
}

} // namespace

int main() {
    test_filter_compares_trimmed_field();
    test_locate_whole_record_and_field();
    test_change_replaces_every_occurrence();
    test_change_result_is_truncated_to_width();
    test_select_builds_a_fresh_record();
    test_case_and_reverse();
    test_take_and_skip_count_across_calls();
    test_duplicate_and_hole();
    test_count_flushes_the_total();
    test_literal_emits_exactly_once();
    test_stage_chain_is_fresh_per_call();
    test_stage_failure_points_at_the_command();

    return 0;
}
