#pragma once

#include "hash/Runner.hpp"
#include "task/model/BatchResult.hpp"
#include "task/model/InputFile.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

namespace ssdw::task {

struct Request {
    std::optional<std::string> pipe_result;
    std::optional<std::vector<model::InputFile>> input_files;
    std::filesystem::path output_path;
    std::optional<std::string> workflow_id;
    nlohmann::json task_config = nlohmann::json::object();
};

void from_json(const nlohmann::json& j, Request& r);

// Entry point the pipeline calls: resolves inputs, hashes them into
// output_path and hands back the encoded batch result.
class HashTask {
public:
    // Null loggers fall back to the registry's "task" and "hash" loggers
    explicit HashTask(std::shared_ptr<hash::Runner> runner,
                      std::shared_ptr<spdlog::logger> log = nullptr,
                      std::shared_ptr<spdlog::logger> hashLog = nullptr);

    [[nodiscard]] model::BatchResult run(const Request& request) const;

    // Same as run(), base64 JSON as the next stage expects it
    std::string operator()(const Request& request) const;

private:
    std::shared_ptr<hash::Runner> runner_;
    std::shared_ptr<spdlog::logger> log_;
    std::shared_ptr<spdlog::logger> hashLog_;

    void warnOnUnknownConfig(const nlohmann::json& taskConfig) const;
};

}
