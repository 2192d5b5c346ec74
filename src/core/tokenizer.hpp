#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cardpipe {

// One logical DSL line with the PIPE keyword, the leading '|' and comments
// already removed. text is empty only for terminator lines.
struct SourceLine {
    std::size_t number{0};
    std::string text;
    bool continuation{false};
    bool pipe_keyword{false};
    bool terminator{false};
};

class Tokenizer {
  public:
    [[nodiscard]] std::vector<SourceLine> split(std::string_view input) const;
};

} // namespace cardpipe
