#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ssdw::config {

struct WorkerConfig {
    std::string ssdeep_binary = "ssdeep";
    std::filesystem::path output_dir = "/var/lib/ssdeep-worker/output";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum worker  = spdlog::level::info;   // Startup, shutdown, CLI faults
    spdlog::level::level_enum hash    = spdlog::level::info;   // Per-file tool failures surface as warnings
    spdlog::level::level_enum task    = spdlog::level::info;   // Input resolution and batch summaries
    spdlog::level::level_enum storage = spdlog::level::warn;   // Output directory and artifact I/O
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/ssdeep-worker";
    LogLevelsConfig levels;
};

struct Config {
    WorkerConfig worker;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const WorkerConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

}
