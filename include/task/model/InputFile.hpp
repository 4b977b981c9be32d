#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ssdw::task::model {

constexpr const auto* DEFAULT_DISPLAY_NAME = "input_file";

struct InputFile {
    std::optional<std::string> path;
    std::optional<std::string> display_name;
    std::optional<std::string> filename;
    std::optional<std::string> uuid;

    InputFile() = default;
    explicit InputFile(std::string path);

    [[nodiscard]] bool hasPath() const { return path && !path->empty(); }

    // display_name, else filename, else "input_file"
    [[nodiscard]] std::string displayName() const;
};

void to_json(nlohmann::json& j, const InputFile& f);
void from_json(const nlohmann::json& j, InputFile& f);

std::vector<InputFile> input_files_from_json(const nlohmann::json& j);

}
