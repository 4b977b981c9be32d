#pragma once

#include "hash/model/ExecResult.hpp"

#include <filesystem>

namespace ssdw::hash {

// Runs the fuzzy hashing tool against a single file
class Runner {
public:
    virtual ~Runner() = default;

    virtual model::ExecResult run(const std::filesystem::path& path) = 0;
};

}
