#include "task/model/OutputFile.hpp"

#include <nlohmann/json.hpp>

void ssdw::task::model::to_json(nlohmann::json& j, const OutputFile& f) {
    j = {
        {"uuid", f.uuid},
        {"filename", f.filename},
        {"display_name", f.display_name},
        {"extension", f.extension},
        {"data_type", f.data_type},
        {"path", f.path.string()}
    };

    if (f.source_file_id) j["source_file_id"] = *f.source_file_id;
    else j["source_file_id"] = nullptr;
}

void ssdw::task::model::from_json(const nlohmann::json& j, OutputFile& f) {
    j.at("uuid").get_to(f.uuid);
    j.at("filename").get_to(f.filename);
    j.at("display_name").get_to(f.display_name);
    f.extension = j.value("extension", "");
    f.data_type = j.value("data_type", "");
    f.path = j.at("path").get<std::string>();

    if (j.contains("source_file_id") && !j.at("source_file_id").is_null())
        f.source_file_id = j.at("source_file_id").get<std::string>();
    else f.source_file_id = std::nullopt;
}
