#pragma once
// include/blockworld/app/BlockWorldApp.hpp
//
// load map -> apply actions -> save map, with the process exit codes.

#include <istream>
#include <ostream>
#include <string_view>
#include <vector>

namespace blockworld::app {

enum ExitCode : int {
    kExitOk            = 0,
    kExitUsage         = 1,
    kExitLoadFailed    = 2,
    kExitActionsOpen   = 3,
    kExitActionsFailed = 4,
    kExitSaveFailed    = 5,
};

// `in` backs the standard-input action source; action results go to `out`,
// failures to `err`.
[[nodiscard]] int RunBlockWorld(const std::vector<std::string_view>& argv,
                                std::istream& in,
                                std::ostream& out,
                                std::ostream& err);

} // namespace blockworld::app
