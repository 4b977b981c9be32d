#pragma once

#include "hash/Runner.hpp"
#include "hash/model/Outcome.hpp"
#include "storage/OutputStore.hpp"
#include "task/model/BatchResult.hpp"
#include "task/model/InputFile.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace ssdw::hash {

constexpr const auto* ARTIFACT_EXTENSION = "ssdeep";
constexpr const auto* ARTIFACT_DATA_TYPE = "text/plain";
constexpr const auto* ARTIFACT_DISPLAY_PREFIX = "SSDeep hash for ";
constexpr const auto* NO_INPUT_MESSAGE = "No input files provided to calculate SSDeep hash.";

// Hashes each input in order and writes one artifact per input that has a path.
// Tool failures end up inside the artifact; only OutputStore and artifact I/O
// failures escape run().
class BatchHasher {
public:
    BatchHasher(std::shared_ptr<Runner> runner,
                std::shared_ptr<storage::OutputStore> store,
                std::shared_ptr<spdlog::logger> log);

    [[nodiscard]] task::model::BatchResult run(const std::vector<task::model::InputFile>& inputs,
                                               const std::optional<std::string>& workflowId = std::nullopt) const;

    // Invoke + classify a single file. Never throws on tool or process failure.
    [[nodiscard]] model::Outcome hash(const std::filesystem::path& path) const;

private:
    std::shared_ptr<Runner> runner_;
    std::shared_ptr<storage::OutputStore> store_;
    std::shared_ptr<spdlog::logger> log_;

    task::model::OutputFile emit(const task::model::InputFile& input, const model::Outcome& outcome) const;
};

}
