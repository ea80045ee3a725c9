#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "problem.h"

namespace Shardrun {

struct ShardSpec {
    int shard_ct = 1;
    int shard_id = 0;
    // Unset: the whole slice
    std::optional<int> num_examples;
};

/**
 * Deterministic contiguous partitioning of the ordered problem set.
 *
 * Shard k covers [k*q, (k+1)*q) with q = n / shard_ct (integer division).
 * The n % shard_ct trailing problems belong to no shard.
 */
class ShardPlanner {
public:
    // Size of every shard's slice.
    static size_t SliceSize(size_t total, int shard_ct);

    // Number of trailing problems no shard covers.
    static size_t Remainder(size_t total, int shard_ct);

    /**
     * Returns the ordered problems this shard processes: the first
     * num_examples of the slice, or the full slice.
     * @throws ConfigurationError on invalid shard arguments or when
     *         num_examples exceeds the slice length
     */
    static std::vector<Problem> Plan(const std::vector<Problem>& problems, const ShardSpec& spec);
};

} // namespace Shardrun
