#pragma once

#include <cstddef>
#include <cstdlib>
#include <string_view>

#include <spdlog/spdlog.h>

namespace EnumFusion::detail {

// A broken bijection can't be recovered from: report and stop. Not constexpr,
// so reaching it during constant evaluation fails at the call site.
[[noreturn]] inline void contract_violation(std::string_view what) {
    spdlog::critical("[[[ EnumFusion ]]] contract violation: {}", what);
    std::abort();
}

[[noreturn]] inline void index_out_of_range(std::string_view where, std::size_t index, std::size_t cardinality) {
    spdlog::critical("[[[ EnumFusion ]]] contract violation: {} called with index {} (cardinality {})",
                     where, index, cardinality);
    std::abort();
}

} // namespace EnumFusion::detail
