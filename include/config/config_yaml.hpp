#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ssdw::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

inline spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<WorkerConfig> {
    static Node encode(const WorkerConfig& rhs) {
        Node node;
        node["ssdeep_binary"] = rhs.ssdeep_binary;
        node["output_dir"] = rhs.output_dir.string();
        return node;
    }

    static bool decode(const Node& node, WorkerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.ssdeep_binary = node["ssdeep_binary"].as<std::string>("ssdeep");
        rhs.output_dir = node["output_dir"].as<std::string>("/var/lib/ssdeep-worker/output");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["worker"]  = to_std_string(spdlog::level::to_string_view(rhs.worker));
        node["hash"]    = to_std_string(spdlog::level::to_string_view(rhs.hash));
        node["task"]    = to_std_string(spdlog::level::to_string_view(rhs.task));
        node["storage"] = to_std_string(spdlog::level::to_string_view(rhs.storage));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.worker = levelOr(node["worker"], spdlog::level::info);
        rhs.hash = levelOr(node["hash"], spdlog::level::info);
        rhs.task = levelOr(node["task"], spdlog::level::info);
        rhs.storage = levelOr(node["storage"], spdlog::level::warn);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node["console_log_level"], spdlog::level::info);
        rhs.file_log_level = levelOr(node["file_log_level"], spdlog::level::warn);
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/ssdeep-worker");
        if (const auto levels = node["levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}
