#include "shard_planner.h"

#include <string>

#include <glog/logging.h>

#include "common/errors.h"

namespace Shardrun {

size_t ShardPlanner::SliceSize(size_t total, int shard_ct) {
    return shard_ct > 0 ? total / static_cast<size_t>(shard_ct) : 0;
}

size_t ShardPlanner::Remainder(size_t total, int shard_ct) {
    return shard_ct > 0 ? total % static_cast<size_t>(shard_ct) : 0;
}

std::vector<Problem> ShardPlanner::Plan(const std::vector<Problem>& problems, const ShardSpec& spec) {
    if (spec.shard_ct < 1) {
        throw ConfigurationError("shard_ct must be at least 1, got " + std::to_string(spec.shard_ct));
    }
    if (spec.shard_id < 0 || spec.shard_id >= spec.shard_ct) {
        throw ConfigurationError("shard_id " + std::to_string(spec.shard_id) +
                                 " is outside [0, " + std::to_string(spec.shard_ct) + ")");
    }

    const size_t slice = SliceSize(problems.size(), spec.shard_ct);
    const size_t begin = static_cast<size_t>(spec.shard_id) * slice;

    size_t count = slice;
    if (spec.num_examples.has_value()) {
        if (*spec.num_examples < 0) {
            throw ConfigurationError("num_examples cannot be negative");
        }
        if (static_cast<size_t>(*spec.num_examples) > slice) {
            throw ConfigurationError(
                "num_examples (" + std::to_string(*spec.num_examples) +
                ") is greater than the number of examples in the shard (" + std::to_string(slice) +
                "). Either decrease num_examples or decrease the number of shards.");
        }
        count = static_cast<size_t>(*spec.num_examples);
    }

    const size_t remainder = Remainder(problems.size(), spec.shard_ct);
    if (remainder > 0) {
        LOG(WARNING) << remainder << " trailing problem(s) of " << problems.size()
                     << " are not covered by any of the " << spec.shard_ct << " shards";
    }

    return std::vector<Problem>(problems.begin() + begin, problems.begin() + begin + count);
}

} // namespace Shardrun
