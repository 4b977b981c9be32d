#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace ssdw::log {

// Creates dir if needed; false with error filled in when it is not a usable directory
bool ensureLogDir(const std::filesystem::path& dir, std::string& error);

class Registry {
public:
    // Initialize all loggers with sinks/levels. Falls back to console-only
    // logging when logDir cannot be created or opened.
    static void init(const std::filesystem::path& logDir);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> worker()  { return get("ssdeep-worker"); }
    static std::shared_ptr<spdlog::logger> hash()    { return get("hash"); }
    static std::shared_ptr<spdlog::logger> task()    { return get("task"); }
    static std::shared_ptr<spdlog::logger> storage() { return get("storage"); }

    [[nodiscard]] static bool isInitialized();
    [[nodiscard]] static bool fileLoggingEnabled();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    // stderr keeps the CLI's stdout free for the encoded result
    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
