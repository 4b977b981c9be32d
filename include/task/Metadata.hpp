#pragma once

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ssdw::task {

constexpr const auto* TASK_NAME = "ssdeep-worker.tasks.calculate_ssdeep_hash";

// One user-facing option a task accepts
struct ConfigOption {
    std::string name;
    std::string label;
    std::string description;
    std::string type;
    bool required = false;
};

struct Metadata {
    std::string name;
    std::string display_name;
    std::string description;
    std::vector<ConfigOption> task_config;
};

const Metadata& metadata();

void to_json(nlohmann::json& j, const ConfigOption& o);
void to_json(nlohmann::json& j, const Metadata& m);

}
