#include "cli.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <string_view>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace ssdw::cli {

namespace {

nlohmann::json readRequestJson(const std::filesystem::path& path) {
    std::string body;
    if (path == "-") {
        body.assign(std::istreambuf_iterator<char>(std::cin), {});
    } else {
        std::ifstream in(path);
        if (!in) throw std::runtime_error("Failed to open request file: " + path.string());
        body.assign(std::istreambuf_iterator<char>(in), {});
    }

    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) throw std::runtime_error("Request is not valid JSON: " + path.string());
    return j;
}

}

Options parseArgs(const int argc, const char* const argv[]) {
    Options opts;
    bool positionalOnly = false;

    auto value = [&](int& i, std::string_view flag) -> std::string {
        if (i + 1 >= argc) throw UsageError(fmt::format("Missing value for {}", flag));
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (positionalOnly || arg.empty() || arg == "-" || arg.front() != '-') {
            opts.files.emplace_back(arg);
            continue;
        }

        if (arg == "--") positionalOnly = true;
        else if (arg == "-h" || arg == "--help") opts.help = true;
        else if (arg == "--json") opts.json = true;
        else if (arg == "--describe") opts.describe = true;
        else if (arg == "--print-config") opts.print_config = true;
        else if (arg == "-c" || arg == "--config") opts.config_path = value(i, arg);
        else if (arg == "--log-dir") opts.log_dir = value(i, arg);
        else if (arg == "-o" || arg == "--output-path") opts.output_path = value(i, arg);
        else if (arg == "-r" || arg == "--request") opts.request_path = value(i, arg);
        else if (arg == "-w" || arg == "--workflow-id") opts.workflow_id = value(i, arg);
        else if (arg == "-p" || arg == "--pipe-result") opts.pipe_result = value(i, arg);
        else throw UsageError(fmt::format("Unknown option: {}", arg));
    }

    return opts;
}

std::string usage(const std::string& prog) {
    return fmt::format(
        "Usage: {} [options] [FILE...]\n"
        "\n"
        "Computes the ssdeep fuzzy hash of each FILE and writes one .ssdeep artifact per\n"
        "file. Prints the base64-encoded batch result on stdout.\n"
        "\n"
        "Options:\n"
        "  -c, --config FILE        worker config (default $SSDEEP_WORKER_CONFIG or /etc/ssdeep-worker/config.yaml)\n"
        "      --log-dir DIR        override logging.log_dir (console only if it cannot be created)\n"
        "  -o, --output-path DIR    where artifacts are written (default worker.output_dir)\n"
        "  -r, --request FILE       JSON task request, '-' for stdin\n"
        "  -w, --workflow-id ID     workflow id echoed in the result\n"
        "  -p, --pipe-result B64    encoded result of the previous stage; overrides FILE arguments\n"
        "      --json               print the result as JSON instead of base64\n"
        "      --describe           print task registration metadata and exit\n"
        "      --print-config       print the effective config and exit\n"
        "  -h, --help               show this help\n",
        prog);
}

task::Request buildRequest(const Options& opts, const config::Config& cfg) {
    task::Request req;
    if (opts.request_path) req = readRequestJson(*opts.request_path).get<task::Request>();

    if (opts.output_path) req.output_path = *opts.output_path;
    else if (req.output_path.empty()) req.output_path = cfg.worker.output_dir;

    if (opts.workflow_id) req.workflow_id = opts.workflow_id;
    if (opts.pipe_result) req.pipe_result = opts.pipe_result;

    if (!opts.files.empty()) {
        if (!req.input_files) req.input_files.emplace();
        for (const auto& f : opts.files) req.input_files->emplace_back(f);
    }

    return req;
}

}
