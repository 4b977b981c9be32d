#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

namespace ssdw::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to parse config file {}: {}", path.string(), e.what()));
    }

    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping: " + path.string());

    if (auto node = root["worker"]) {
        if (!YAML::convert<WorkerConfig>::decode(node, cfg.worker))
            throw std::runtime_error("Config section 'worker' must be a mapping");
    }
    if (auto node = root["logging"]) {
        if (!YAML::convert<LoggingConfig>::decode(node, cfg.logging))
            throw std::runtime_error("Config section 'logging' must be a mapping");
    }

    return cfg;
}

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"worker", c.worker},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const WorkerConfig& c) {
    j = {
        {"ssdeep_binary", c.ssdeep_binary},
        {"output_dir", c.output_dir.string()}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"worker", levelName(c.worker)},
        {"hash", levelName(c.hash)},
        {"task", levelName(c.task)},
        {"storage", levelName(c.storage)}
    };
}

}
