#pragma once

#include "hash/Runner.hpp"

#include <string>
#include <vector>

namespace ssdw::hash {

// -s: silent, tool errors go to stdout instead of failing the process
// -b: bare, strip directory components from the reported filename
constexpr const auto* COMMAND_SIGNATURE = "ssdeep -s -b";

// Exit code reported when the binary could not be executed at all
constexpr int EXEC_FAILED_CODE = 127;

class SsdeepRunner final : public Runner {
public:
    explicit SsdeepRunner(std::string binary = "ssdeep");

    model::ExecResult run(const std::filesystem::path& path) override;

    [[nodiscard]] std::vector<std::string> argv(const std::filesystem::path& path) const;

    [[nodiscard]] const std::string& binary() const { return binary_; }

private:
    std::string binary_;
};

}
