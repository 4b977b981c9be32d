#include "cli.hpp"

#include "config/ConfigRegistry.hpp"
#include "hash/SsdeepRunner.hpp"
#include "log/Registry.hpp"
#include "runtime/paths.hpp"
#include "task/HashTask.hpp"
#include "task/Metadata.hpp"
#include "task/codec.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

using namespace ssdw;
using namespace ssdw::config;

int main(const int argc, char** argv) {
    cli::Options opts;
    try {
        opts = cli::parseArgs(argc, argv);
    } catch (const cli::UsageError& e) {
        std::cerr << e.what() << "\n\n" << cli::usage(argv[0]);
        return 2;
    }

    if (opts.help) {
        std::cout << cli::usage(argv[0]);
        return 0;
    }

    if (opts.describe) {
        std::cout << nlohmann::json(task::metadata()).dump(2) << std::endl;
        return 0;
    }

    try {
        if (opts.config_path) paths::setConfigPath(*opts.config_path);
        ConfigRegistry::init();
        const auto& cfg = ConfigRegistry::get();

        if (opts.print_config) {
            std::cout << nlohmann::json(cfg).dump(2) << std::endl;
            return 0;
        }

        log::Registry::init(opts.log_dir.value_or(cfg.logging.log_dir));
        log::Registry::worker()->debug("[main] Using config {}", paths::getConfigPath().string());

        const auto request = cli::buildRequest(opts, cfg);
        const task::HashTask hashTask(std::make_shared<hash::SsdeepRunner>(cfg.worker.ssdeep_binary));
        const auto result = hashTask.run(request);

        if (opts.json) std::cout << nlohmann::json(result).dump(2) << std::endl;
        else std::cout << task::codec::encodeResult(result) << std::endl;

        return 0;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::worker()->error("[main] {}", e.what());
        else std::cerr << "ssdeep-worker: " << e.what() << std::endl;
        return 1;
    }
}
