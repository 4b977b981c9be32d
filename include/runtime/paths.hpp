#pragma once

#include <filesystem>

namespace ssdw::paths {

constexpr const auto* CONFIG_ENV_VAR = "SSDEEP_WORKER_CONFIG";

std::filesystem::path getConfigPath();
std::filesystem::path getLogPath();

void setConfigPath(const std::filesystem::path& path);
void setLogPath(const std::filesystem::path& path);

// Points logs at a throwaway directory under the system temp dir
void setLogPathForTesting();

}
