#pragma once

#include <string>

namespace Shardrun {

// One benchmark problem. The id encodes "<owner>__<repo>-<issue>".
struct Problem {
    std::string id;
    std::string statement;
};

} // namespace Shardrun
