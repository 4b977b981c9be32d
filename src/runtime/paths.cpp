#include "runtime/paths.hpp"

#include <cstdlib>
#include <mutex>
#include <optional>
#include <unistd.h>

namespace ssdw::paths {

namespace {

constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/ssdeep-worker/config.yaml";
constexpr const auto* DEFAULT_LOG_PATH = "/var/log/ssdeep-worker";

std::mutex mutex_;
std::optional<std::filesystem::path> configOverride_;
std::optional<std::filesystem::path> logOverride_;

std::optional<std::filesystem::path> logPathOverride() {
    std::scoped_lock lock(mutex_);
    return logOverride_;
}

}

std::filesystem::path getConfigPath() {
    std::scoped_lock lock(mutex_);
    if (configOverride_) return *configOverride_;
    if (const char* env = std::getenv(CONFIG_ENV_VAR); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

std::filesystem::path getLogPath() {
    if (const auto p = logPathOverride()) return *p;
    return DEFAULT_LOG_PATH;
}

void setConfigPath(const std::filesystem::path& path) {
    std::scoped_lock lock(mutex_);
    configOverride_ = path;
}

void setLogPath(const std::filesystem::path& path) {
    std::scoped_lock lock(mutex_);
    logOverride_ = path;
}

void setLogPathForTesting() {
    setLogPath(std::filesystem::temp_directory_path() / ("ssdeep_worker_test_logs_" + std::to_string(::getpid())));
}

}
