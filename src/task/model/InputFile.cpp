#include "task/model/InputFile.hpp"

#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace ssdw::task::model;

namespace {

std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<std::string>();
}

}

InputFile::InputFile(std::string path)
    : path(std::move(path)) {
    filename = std::filesystem::path(*this->path).filename().string();
    display_name = filename;
}

std::string InputFile::displayName() const {
    if (display_name) return *display_name;
    if (filename) return *filename;
    return DEFAULT_DISPLAY_NAME;
}

void ssdw::task::model::to_json(nlohmann::json& j, const InputFile& f) {
    j = nlohmann::json::object();
    if (f.path) j["path"] = *f.path;
    if (f.display_name) j["display_name"] = *f.display_name;
    if (f.filename) j["filename"] = *f.filename;
    if (f.uuid) j["uuid"] = *f.uuid;
}

void ssdw::task::model::from_json(const nlohmann::json& j, InputFile& f) {
    if (!j.is_object()) throw std::runtime_error("Input file entry must be a JSON object: " + j.dump());
    f.path = optionalString(j, "path");
    f.display_name = optionalString(j, "display_name");
    f.filename = optionalString(j, "filename");
    f.uuid = optionalString(j, "uuid");
}

std::vector<InputFile> ssdw::task::model::input_files_from_json(const nlohmann::json& j) {
    if (j.is_null()) return {};
    if (!j.is_array()) throw std::runtime_error("Input files must be a JSON array");

    std::vector<InputFile> files;
    files.reserve(j.size());
    for (const auto& entry : j) files.push_back(entry.get<InputFile>());
    return files;
}
