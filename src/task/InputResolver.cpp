#include "task/InputResolver.hpp"
#include "task/codec.hpp"

#include <nlohmann/json.hpp>

namespace ssdw::task {

std::vector<model::InputFile> resolveInputFiles(const std::optional<std::string>& pipeResult,
                                                const std::optional<std::vector<model::InputFile>>& inputFiles) {
    if (pipeResult && !pipeResult->empty()) {
        const auto upstream = codec::decode(*pipeResult);
        if (!upstream.contains("output_files")) return {};
        return model::input_files_from_json(upstream.at("output_files"));
    }

    return inputFiles.value_or(std::vector<model::InputFile>{});
}

}
