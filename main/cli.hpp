#pragma once

#include "config/Config.hpp"
#include "task/HashTask.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ssdw::cli {

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Options {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> log_dir;
    std::optional<std::filesystem::path> output_path;
    std::optional<std::filesystem::path> request_path;   // "-" reads stdin
    std::optional<std::string> workflow_id;
    std::optional<std::string> pipe_result;
    std::vector<std::string> files;
    bool json = false;
    bool describe = false;
    bool print_config = false;
    bool help = false;
};

Options parseArgs(int argc, const char* const argv[]);

std::string usage(const std::string& prog = "ssdeep-worker");

// Request file first (if any), then flags, then positional files appended
task::Request buildRequest(const Options& opts, const config::Config& cfg);

}
