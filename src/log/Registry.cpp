#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <system_error>
#include <vector>

namespace ssdw::log {

bool ensureLogDir(const std::filesystem::path& dir, std::string& error) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (dir.empty()) {
        error = "log directory is empty";
        return false;
    }
    if (!fs::exists(dir, ec)) fs::create_directories(dir, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    if (!fs::is_directory(dir, ec)) {
        error = "not a directory";
        return false;
    }
    return true;
}

void Registry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    main_log_path_ = log_dir_ / "ssdeep-worker.log";

    const config::LoggingConfig cnf = config::ConfigRegistry::isInitialized()
        ? config::ConfigRegistry::get().logging
        : config::LoggingConfig{};

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    std::string fileError;
    if (ensureLogDir(log_dir_, fileError)) {
        try {
            main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                main_log_path_.string(), main_max_bytes_, main_max_files_);
            main_file_sink_->set_level(cnf.levels.file_log_level);
            main_file_sink_->set_pattern(LOG_FORMAT);
            sinks.push_back(main_file_sink_);
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }

    auto makeLogger = [&](const std::string& name,
                          const spdlog::level::level_enum lvl = spdlog::level::debug) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("ssdeep-worker", sub_levels.worker);
    makeLogger("hash",          sub_levels.hash);
    makeLogger("task",          sub_levels.task);
    makeLogger("storage",       sub_levels.storage);

    initialized_ = true;

    if (main_file_sink_) worker()->debug("[log::Registry] Initialized, writing to {}", main_log_path_.string());
    else worker()->warn("[log::Registry] Cannot log to {} ({}), logging to console only",
                        log_dir_.string(), fileError);
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

bool Registry::fileLoggingEnabled() { return main_file_sink_ != nullptr; }

}
