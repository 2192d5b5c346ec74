#include "core/tokenizer.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace cardpipe {

namespace {

[[nodiscard]] std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }

    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }

    return text;
}

[[nodiscard]] bool starts_with_pipe_keyword(std::string_view text) {
    constexpr std::string_view keyword = "PIPE";
    if (text.size() < keyword.size()) {
        return false;
    }

    for (std::size_t i = 0; i < keyword.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(text[i])) != keyword[i]) {
            return false;
        }
    }

    return text.size() == keyword.size() || std::isspace(static_cast<unsigned char>(text[keyword.size()]));
}

} // namespace

std::vector<SourceLine> Tokenizer::split(std::string_view input) const {
    std::vector<SourceLine> lines;
    std::size_t number = 0;
    std::size_t start = 0;

    while (start <= input.size()) {
        std::size_t end = input.find('\n', start);
        if (end == std::string_view::npos) {
            end = input.size();
        }

        std::string_view text = trim(input.substr(start, end - start));
        start = end + 1;
        ++number;

        if (text.empty() || text.front() == '#') {
            continue;
        }

        SourceLine line;
        line.number = number;

        if (starts_with_pipe_keyword(text)) {
            line.pipe_keyword = true;
            text = trim(text.substr(4));
        }

        if (!text.empty() && text.front() == '|') {
            line.continuation = true;
            text = trim(text.substr(1));
        }

        if (text == "?") {
            line.terminator = true;
        } else {
            line.text = std::string(text);
        }

        lines.push_back(std::move(line));
    }

    return lines;
}

} // namespace cardpipe
