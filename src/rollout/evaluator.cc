#include "evaluator.h"

#include <glog/logging.h>
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

#include "common/configuration.h"
#include "common/errors.h"
#include "common/json_io.h"

namespace Shardrun {

EvaluatorOptions EvaluatorOptions::FromConfig(const ShardrunConfig& config) {
    EvaluatorOptions o;
    std::vector<std::string> command = absl::StrSplit(config.evaluation.command.get(), ' ', absl::SkipWhitespace());
    o.command = std::move(command);
    o.dataset_name = config.evaluation.dataset_name.get();
    o.generator_name = config.agent.generator_name.get();
    o.timeout = std::chrono::seconds(config.evaluation.timeout_s.get());
    return o;
}

HarnessEvaluator::HarnessEvaluator(ProcessRunner& runner, EvaluatorOptions options)
    : runner_(runner), options_(std::move(options)) {}

std::filesystem::path HarnessEvaluator::ReportPath(const RolloutJob& job) const {
    return job.artifact_dir / absl::StrCat(options_.generator_name, ".", job.problem_id, ".json");
}

bool HarnessEvaluator::Evaluate(const RolloutJob& job, const std::filesystem::path& predictions_path) {
    const std::filesystem::path report_path = ReportPath(job);
    std::error_code ec;
    std::filesystem::remove(report_path, ec);

    ProcessSpec spec;
    spec.argv = options_.command;
    spec.argv.insert(spec.argv.end(), {
        "--dataset_name", options_.dataset_name,
        "--predictions_path", predictions_path.string(),
        "--instance_ids", job.problem_id,
        "--run_id", job.problem_id,
        "--max_workers", "1",
    });
    spec.working_dir = job.artifact_dir.string();
    spec.output_path = (job.artifact_dir / "eval_logs.txt").string();
    spec.timeout = options_.timeout;

    LOG(INFO) << job.Tag() << " Evaluating the generated diff";
    VLOG(1) << job.Tag() << " " << FormatCommand(spec.argv);
    ProcessResult r;
    try {
        r = runner_.Run(spec);
    } catch (const std::exception& e) {
        throw EvaluationError(absl::StrCat("Cannot start evaluator: ", e.what()));
    }
    if (r.timed_out) {
        throw EvaluationError(absl::StrCat("Evaluator exceeded its deadline of ", options_.timeout.count(), "s"));
    }
    if (r.exit_code != 0) {
        LOG(WARNING) << job.Tag() << " Evaluator exited with code " << r.exit_code << "; reading report anyway";
    }

    if (!std::filesystem::exists(report_path, ec)) {
        throw EvaluationError("Evaluator wrote no report at " + report_path.string());
    }
    Json::Value report;
    try {
        report = ReadJsonFile(report_path);
    } catch (const std::exception& e) {
        throw EvaluationError(absl::StrCat("Unreadable evaluation report: ", e.what()));
    }
    if (!report.isObject() || !report["resolved_ids"].isArray()) {
        throw EvaluationError("Evaluation report " + report_path.string() + " has no resolved_ids list");
    }
    for (const auto& id : report["resolved_ids"]) {
        if (id.isString() && id.asString() == job.problem_id) {
            LOG(INFO) << job.Tag() << " Resolved";
            return true;
        }
    }
    LOG(INFO) << job.Tag() << " Not resolved";
    return false;
}

} // namespace Shardrun
