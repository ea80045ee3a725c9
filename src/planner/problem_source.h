#pragma once

#include <filesystem>
#include <vector>

#include "problem.h"

namespace Shardrun {

/**
 * Loads the ordered problem set from a JSONL export of the benchmark dataset.
 * Each non-blank line is an object with "instance_id" and "problem_statement".
 * File order is preserved; it defines shard boundaries.
 *
 * @throws ConfigurationError if the file is missing, a line is malformed,
 *         a field is missing, or an id repeats.
 */
std::vector<Problem> LoadProblems(const std::filesystem::path& path);

} // namespace Shardrun
