#pragma once

#include "task/model/InputFile.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ssdw::task {

// An upstream pipe result takes precedence over an explicit list. Order is kept,
// nothing is filtered. Throws std::runtime_error if the pipe result can't be decoded.
std::vector<model::InputFile> resolveInputFiles(const std::optional<std::string>& pipeResult,
                                                const std::optional<std::vector<model::InputFile>>& inputFiles);

}
