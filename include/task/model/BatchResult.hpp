#pragma once

#include "task/model/OutputFile.hpp"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ssdw::task::model {

struct BatchResult {
    std::vector<OutputFile> output_files;
    std::optional<std::string> workflow_id;
    std::string command;
    nlohmann::json meta = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const BatchResult& r);

}
