#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ssdw::task::model {

// An artifact allocated by the output store; the caller writes its contents
struct OutputFile {
    std::string uuid;
    std::string filename;
    std::string display_name;
    std::string extension;
    std::string data_type;
    std::filesystem::path path;
    std::optional<std::string> source_file_id;
};

void to_json(nlohmann::json& j, const OutputFile& f);
void from_json(const nlohmann::json& j, OutputFile& f);

}
