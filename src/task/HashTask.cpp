#include "task/HashTask.hpp"
#include "task/InputResolver.hpp"
#include "task/Metadata.hpp"
#include "task/codec.hpp"
#include "hash/BatchHasher.hpp"
#include "storage/LocalOutputStore.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace ssdw::task;

void ssdw::task::from_json(const nlohmann::json& j, Request& r) {
    if (!j.is_object()) throw std::runtime_error("Task request must be a JSON object");

    if (j.contains("pipe_result") && !j.at("pipe_result").is_null())
        r.pipe_result = j.at("pipe_result").get<std::string>();

    if (j.contains("input_files") && !j.at("input_files").is_null())
        r.input_files = model::input_files_from_json(j.at("input_files"));

    if (j.contains("output_path") && !j.at("output_path").is_null())
        r.output_path = j.at("output_path").get<std::string>();

    if (j.contains("workflow_id") && !j.at("workflow_id").is_null())
        r.workflow_id = j.at("workflow_id").get<std::string>();

    if (j.contains("task_config") && !j.at("task_config").is_null())
        r.task_config = j.at("task_config");
}

HashTask::HashTask(std::shared_ptr<hash::Runner> runner,
                   std::shared_ptr<spdlog::logger> log,
                   std::shared_ptr<spdlog::logger> hashLog)
    : runner_(std::move(runner)),
      log_(log ? std::move(log) : log::Registry::task()),
      hashLog_(hashLog ? std::move(hashLog) : log::Registry::hash()) {
    if (!runner_) throw std::invalid_argument("HashTask requires a runner");
}

void HashTask::warnOnUnknownConfig(const nlohmann::json& taskConfig) const {
    if (!taskConfig.is_object()) {
        log_->warn("[HashTask] Ignoring task_config that is not an object: {}", taskConfig.dump());
        return;
    }

    const auto& known = metadata().task_config;
    for (const auto& item : taskConfig.items()) {
        const auto& key = item.key();
        const bool recognized = std::ranges::any_of(known, [&](const auto& opt) { return opt.name == key; });
        if (!recognized) log_->warn("[HashTask] Ignoring unrecognized task_config option '{}'", key);
    }
}

model::BatchResult HashTask::run(const Request& request) const {
    warnOnUnknownConfig(request.task_config);

    const auto inputs = resolveInputFiles(request.pipe_result, request.input_files);
    log_->info("[HashTask] Workflow {}: {} input file(s) resolved",
               request.workflow_id.value_or("<none>"), inputs.size());

    const auto store = std::make_shared<storage::LocalOutputStore>(request.output_path);
    const hash::BatchHasher hasher(runner_, store, hashLog_);
    return hasher.run(inputs, request.workflow_id);
}

std::string HashTask::operator()(const Request& request) const {
    return codec::encodeResult(run(request));
}
