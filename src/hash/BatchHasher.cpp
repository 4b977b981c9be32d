#include "hash/BatchHasher.hpp"
#include "hash/Classifier.hpp"
#include "hash/SsdeepRunner.hpp"

#include <fstream>
#include <stdexcept>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace ssdw::hash;
using namespace ssdw::task::model;

namespace {

struct Tally {
    size_t success = 0, notice = 0, error = 0, skipped = 0;

    void count(const model::Outcome& outcome) {
        std::visit(model::Overloaded{
            [this](const model::Success&) { ++success; },
            [this](const model::Notice&) { ++notice; },
            [this](const model::Error&) { ++error; }
        }, outcome);
    }
};

}

BatchHasher::BatchHasher(std::shared_ptr<Runner> runner,
                         std::shared_ptr<storage::OutputStore> store,
                         std::shared_ptr<spdlog::logger> log)
    : runner_(std::move(runner)), store_(std::move(store)), log_(std::move(log)) {
    if (!runner_) throw std::invalid_argument("BatchHasher requires a runner");
    if (!store_) throw std::invalid_argument("BatchHasher requires an output store");
    if (!log_) throw std::invalid_argument("BatchHasher requires a logger");
}

model::Outcome BatchHasher::hash(const std::filesystem::path& path) const {
    model::Outcome outcome;
    try {
        outcome = classify(runner_->run(path));
    } catch (const std::exception& e) {
        // Process plumbing failed before ssdeep could report anything
        outcome = model::Error{-1, e.what()};
    }

    if (std::holds_alternative<model::Error>(outcome))
        log_->warn("[BatchHasher] SSDeep failed for {}: {}", path.string(), model::render(outcome));
    else
        log_->debug("[BatchHasher] {} -> {}", path.string(), model::kindName(outcome));

    return outcome;
}

OutputFile BatchHasher::emit(const InputFile& input, const model::Outcome& outcome) const {
    auto artifact = store_->create(ARTIFACT_DISPLAY_PREFIX + input.displayName(),
                                   ARTIFACT_EXTENSION, ARTIFACT_DATA_TYPE, input.uuid);

    std::ofstream out(artifact.path, std::ios::out | std::ios::trunc);
    if (!out.is_open())
        throw std::runtime_error("Failed to open artifact for writing: " + artifact.path.string());

    out << model::render(outcome) << '\n';
    out.close();
    if (!out) throw std::runtime_error("Failed to write artifact: " + artifact.path.string());

    return artifact;
}

BatchResult BatchHasher::run(const std::vector<InputFile>& inputs,
                             const std::optional<std::string>& workflowId) const {
    BatchResult result;
    result.workflow_id = workflowId;
    result.command = COMMAND_SIGNATURE;

    if (inputs.empty()) {
        log_->info("[BatchHasher] No input files, nothing to hash");
        result.meta = {{"message", NO_INPUT_MESSAGE}};
        return result;
    }

    Tally tally;
    for (const auto& input : inputs) {
        if (!input.hasPath()) {
            log_->warn("[BatchHasher] Skipping file entry with no path: {}", nlohmann::json(input).dump());
            ++tally.skipped;
            continue;
        }

        const auto outcome = hash(*input.path);
        tally.count(outcome);
        result.output_files.push_back(emit(input, outcome));
    }

    if (result.output_files.empty())
        log_->warn("[BatchHasher] SSDeep task processed input files but generated no output files overall.");

    log_->info("[BatchHasher] Processed {} input(s): {} hashed, {} notice(s), {} error(s), {} skipped",
               inputs.size(), tally.success, tally.notice, tally.error, tally.skipped);

    return result;
}
