#include "problem_source.h"

#include <fstream>
#include <string>
#include <unordered_set>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/json_io.h"

namespace Shardrun {

std::vector<Problem> LoadProblems(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigurationError("Cannot open dataset file: " + path.string());
    }

    std::vector<Problem> problems;
    std::unordered_set<std::string> seen;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        Json::Value record;
        std::string error;
        if (!ParseJson(line, record, &error) || !record.isObject()) {
            throw ConfigurationError(path.string() + ":" + std::to_string(line_no) +
                                     ": not a JSON object: " + error);
        }
        if (!record["instance_id"].isString() || !record["problem_statement"].isString()) {
            throw ConfigurationError(path.string() + ":" + std::to_string(line_no) +
                                     ": missing instance_id or problem_statement");
        }

        Problem problem{record["instance_id"].asString(), record["problem_statement"].asString()};
        if (problem.id.empty()) {
            throw ConfigurationError(path.string() + ":" + std::to_string(line_no) + ": empty instance_id");
        }
        if (!seen.insert(problem.id).second) {
            throw ConfigurationError(path.string() + ":" + std::to_string(line_no) +
                                     ": duplicate instance_id " + problem.id);
        }
        problems.push_back(std::move(problem));
    }

    LOG(INFO) << "Loaded " << problems.size() << " problems from " << path;
    return problems;
}

} // namespace Shardrun
