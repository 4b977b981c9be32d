#pragma once

#include "storage/OutputStore.hpp"

#include <filesystem>
#include <memory>
#include <spdlog/logger.h>

namespace ssdw::storage {

// Places artifacts as <root>/<uuid>.<extension>
class LocalOutputStore final : public OutputStore {
public:
    explicit LocalOutputStore(std::filesystem::path root,
                              std::shared_ptr<spdlog::logger> log = nullptr);

    task::model::OutputFile create(const std::string& displayName,
                                   const std::string& extension,
                                   const std::string& dataType,
                                   const std::optional<std::string>& sourceFileId) override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::shared_ptr<spdlog::logger> log_;

    void ensureRoot() const;
};

}
