#pragma once

namespace cardpipe {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace cardpipe
